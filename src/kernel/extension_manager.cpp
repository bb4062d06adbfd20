// Keystrap kernel: ExtensionManager implementation
#include "kernel/extension_manager.hpp"

#include <vector>

#include "extension_loader.hpp"  // load_extensions(dir_patterns, registry, sources)

namespace ks {

ExtensionLoadResult ExtensionManager::load_from_dirs_report(
    const std::vector<std::string>& dir_patterns) {
  return load_extensions(dir_patterns, registry_, sources_);
}

void ExtensionManager::seed_builtins_from_registry() {
  for (const auto& key : registry_.get_keys()) {
    if (!sources_.count(key))
      sources_[key] = "built-in";
  }
}

std::string ExtensionManager::source_of(const std::string& capability) const {
  auto it = sources_.find(capability);
  return it == sources_.end() ? std::string() : it->second;
}

int ExtensionManager::unload_by_source(const std::string& absolute_library_path) {
  std::vector<std::string> to_remove;
  for (const auto& [key, src] : sources_)
    if (src == absolute_library_path)
      to_remove.push_back(key);

  int removed = 0;
  for (const auto& k : to_remove) {
    removed += registry_.unregister(k) ? 1 : 0;
    sources_.erase(k);
  }
  return removed;
}

int ExtensionManager::unload_all_extensions() {
  std::vector<std::string> library_keys;
  for (const auto& [key, src] : sources_)
    if (src != "built-in")
      library_keys.push_back(key);

  int removed = 0;
  for (const auto& k : library_keys) {
    removed += registry_.unregister(k) ? 1 : 0;
    sources_.erase(k);
  }
  return removed;
}

}  // namespace ks
