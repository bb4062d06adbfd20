#include "kernel/startup_plan.hpp"

#include <algorithm>

namespace ks {

std::string PluginSpec::dir_name(const std::string& repo) {
    auto slash = repo.find_last_of('/');
    return slash == std::string::npos ? repo : repo.substr(slash + 1);
}

void StartupPlan::override_setting(const std::string& name, const SettingValue& value) {
    auto it = std::find_if(settings.begin(), settings.end(),
                           [&](const auto& kv) { return kv.first == name; });
    if (it != settings.end()) it->second = value;
    else settings.emplace_back(name, value);
}

} // namespace ks
