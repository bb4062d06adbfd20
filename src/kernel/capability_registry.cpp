// Keystrap kernel: CapabilityRegistry implementation
#include "kernel/capability_registry.hpp"

#include <algorithm>

namespace ks {

void CapabilityRegistry::register_capability(const std::string& name, Factory factory) {
    if (name.empty()) throw LoaderError(LoaderErrc::InvalidSetting, "Capability name must not be empty");
    if (!factory) throw LoaderError(LoaderErrc::InvalidSetting, "Capability '" + name + "' has no factory");
    table_[name] = std::move(factory);
}

bool CapabilityRegistry::unregister(const std::string& name) { return table_.erase(name) > 0; }

bool CapabilityRegistry::contains(const std::string& name) const { return table_.count(name) > 0; }

std::vector<std::string> CapabilityRegistry::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(table_.size());
    for (const auto& pair : table_) keys.push_back(pair.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::shared_ptr<Extension> CapabilityRegistry::probe(const std::string& name, std::string* reason) const {
    auto set_reason = [&](const std::string& r) {
        if (reason) *reason = r;
    };
    auto it = table_.find(name);
    if (it == table_.end()) {
        set_reason("capability not registered");
        return nullptr;
    }
    try {
        auto ext = it->second();
        if (!ext) set_reason("factory returned no instance");
        return ext;
    } catch (const std::exception& e) {
        set_reason(std::string("factory failed: ") + e.what());
    } catch (...) {
        set_reason("factory failed with a non-standard exception");
    }
    return nullptr;
}

YAML::Node make_client_capabilities() {
    YAML::Node caps;
    caps["textDocument"]["hover"]["contentFormat"].push_back("markdown");
    caps["textDocument"]["hover"]["contentFormat"].push_back("plaintext");
    caps["textDocument"]["definition"]["linkSupport"] = true;
    caps["textDocument"]["references"]["dynamicRegistration"] = false;
    caps["textDocument"]["rename"]["prepareSupport"] = true;
    caps["textDocument"]["codeAction"]["isPreferredSupport"] = true;
    caps["textDocument"]["completion"]["completionItem"]["snippetSupport"] = false;
    caps["textDocument"]["publishDiagnostics"]["relatedInformation"] = true;
    caps["workspace"]["configuration"] = true;
    return caps;
}

} // namespace ks
