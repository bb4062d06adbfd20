// Kernel extension loader result and error reporting structures
#pragma once

#include <string>
#include <vector>

#include "ks_types.hpp"

namespace ks {

struct ExtensionLoadError {
  std::string path;  // attempted library path
  LoaderErrc code = LoaderErrc::Unknown;
  std::string message;  // optional descriptive message
};

struct ExtensionLoadResult {
  int attempted = 0;
  int loaded = 0;
  std::vector<ExtensionLoadError> errors;
  std::vector<std::string> new_capabilities;  // names registered by this scan
  std::vector<std::string> missing_dirs;      // requested directories that do not exist
};

}  // namespace ks
