// Keystrap kernel: named capability registry populated by extensions
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "kernel/extension.hpp"

namespace ks {

// Owned by the Kernel, never global. Shared libraries receive a pointer to
// it in register_keystrap_extensions().
class KEYSTRAP_API CapabilityRegistry {
public:
    using Factory = std::function<std::shared_ptr<Extension>()>;

    // Re-registering a name replaces the previous factory.
    void register_capability(const std::string& name, Factory factory);
    bool unregister(const std::string& name);
    bool contains(const std::string& name) const;
    std::vector<std::string> get_keys() const;

    // Activation probe: a fresh instance, or nullptr when the capability is
    // missing or its factory fails. Never throws; `reason` receives why.
    std::shared_ptr<Extension> probe(const std::string& name, std::string* reason = nullptr) const;

private:
    std::unordered_map<std::string, Factory> table_;
};

} // namespace ks
