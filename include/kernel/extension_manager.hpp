// Keystrap kernel: ExtensionManager interface
#pragma once

#include <map>
#include <string>
#include <vector>

#include "kernel/capability_registry.hpp"
#include "kernel/load_result.hpp"

namespace ks {

// Manages extension libraries and the capabilities they register.
// - Loads shared libraries through load_extensions().
// - Tracks which capabilities came from which library path for safe unload.
class KEYSTRAP_API ExtensionManager {
public:
    explicit ExtensionManager(CapabilityRegistry& registry) : registry_(registry) {}

    // Load libraries from the given directory patterns and record capability->source mapping.
    ExtensionLoadResult load_from_dirs_report(const std::vector<std::string>& dir_patterns);
    // Mark capabilities registered directly (not from a library) as "built-in".
    void seed_builtins_from_registry();

    // Unregister every capability that was registered by a specific library path.
    // Returns number of capabilities unregistered. The library handle is not closed.
    int unload_by_source(const std::string& absolute_library_path);

    // Unregister all capabilities registered from any library (does not touch built-ins).
    int unload_all_extensions();

    // Capability name -> "built-in" or absolute library path.
    const std::map<std::string, std::string>& capability_sources() const { return sources_; }
    std::string source_of(const std::string& capability) const;

private:
    CapabilityRegistry& registry_;
    std::map<std::string, std::string> sources_;
};

} // namespace ks
