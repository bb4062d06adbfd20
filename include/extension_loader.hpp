// Extension library loading utilities for Keystrap
#pragma once

#include <map>
#include <string>
#include <vector>

// Scans directories for extension libraries and loads them, registering capabilities.
// - dir_patterns: list of directories or simple wildcard patterns to scan for shared libraries.
//   Suffix semantics:
//     - "path" or "path/*"  => shallow scan (only the directory itself)
//     - "path/**"            => recursive scan of all subdirectories
// - sources: map updated with capability name -> library path.
#include "kernel/capability_registry.hpp"
#include "kernel/load_result.hpp"

namespace ks {

// Load extension libraries and report result (no console I/O in kernel).
ExtensionLoadResult load_extensions(const std::vector<std::string>& dir_patterns,
                                    CapabilityRegistry& registry,
                                    std::map<std::string, std::string>& sources);

} // namespace ks
