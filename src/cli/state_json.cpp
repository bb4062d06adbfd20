#include "cli/state_json.hpp"

#include <fstream>

namespace {

nlohmann::json setting_json(const ks::SettingValue& v) {
    if (auto b = std::get_if<bool>(&v)) return *b;
    if (auto i = std::get_if<int>(&v)) return *i;
    return std::get<std::string>(v);
}

} // namespace

nlohmann::json state_to_json(const ks::InteractionService& svc) {
    nlohmann::json j;

    nlohmann::json options = nlohmann::json::object();
    for (const auto& [name, value] : svc.cmd_options().values()) options[name] = setting_json(value);
    j["options"] = options;

    nlohmann::json bindings = nlohmann::json::array();
    for (const auto& b : svc.cmd_bindings()) {
        bindings.push_back({
            {"buffer", b.key.buffer ? nlohmann::json(*b.key.buffer) : nlohmann::json(nullptr)},
            {"mode", std::string(1, ks::mode_to_char(b.key.mode))},
            {"lhs", b.key.lhs},
            {"action", ks::describe_action(b.action)},
            {"owner", b.owner},
            {"desc", b.desc},
            {"silent", b.silent},
        });
    }
    j["bindings"] = bindings;
    j["active_servers"] = svc.cmd_active_servers();
    j["capabilities"] = svc.cmd_capabilities();

    const auto& report = svc.cmd_last_report();
    if (!report) return j;

    j["plan"] = report->plan;
    if (report->bootstrap) {
        j["bootstrap"] = {{"path", report->bootstrap->path.string()}, {"fetched", report->bootstrap->fetched}};
    }
    j["capabilities_contributed"] = report->capabilities_contributed;

    nlohmann::json extensions = nlohmann::json::array();
    for (const auto& r : report->extensions) {
        extensions.push_back({
            {"capability", r.capability},
            {"role", ks::role_name(r.role)},
            {"state", ks::state_name(r.state)},
            {"reason", r.reason},
            {"source", r.source},
            {"bindings", r.bindings},
        });
    }
    j["extensions"] = extensions;

    nlohmann::json servers = nlohmann::json::array();
    for (const auto& s : report->servers)
        servers.push_back({{"name", s.name}, {"active", s.active}, {"reason", s.reason}});
    j["servers"] = servers;

    nlohmann::json rejected = nlohmann::json::array();
    for (const auto& [name, reason] : report->rejected_settings)
        rejected.push_back({{"name", name}, {"reason", reason}});
    j["rejected_settings"] = rejected;

    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& s : report->skipped_bindings)
        skipped.push_back({{"owner", s.owner}, {"modes", s.modes}, {"lhs", s.lhs}, {"reason", s.reason}});
    j["skipped_bindings"] = skipped;
    return j;
}

bool write_state_json(const ks::InteractionService& svc, const std::string& path) {
    std::ofstream out(path);
    if (!out) return false;
    out << state_to_json(svc).dump(2) << "\n";
    return static_cast<bool>(out);
}
