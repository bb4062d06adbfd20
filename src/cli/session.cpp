#include "cli/session.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

void flush_messages(ks::InteractionService& svc, CliSession& session, ks::MessageLevel min_level) {
    for (auto& m : svc.cmd_drain_messages()) {
        if (m.level >= min_level) {
            switch (m.level) {
                case ks::MessageLevel::Error: std::cerr << "Error: " << m.text << "\n"; break;
                case ks::MessageLevel::Warning: std::cerr << "Warning: " << m.text << "\n"; break;
                default: std::cout << m.text << "\n"; break;
            }
        }
        session.log.push_back(std::move(m));
    }
}

std::optional<ks::StartupPlan> resolve_plan(ks::InteractionService& svc, const std::string& manifest,
                                            const std::string& preset) {
    if (!manifest.empty()) {
        auto plan = svc.cmd_load_manifest(manifest);
        if (!plan) {
            auto err = svc.cmd_last_error();
            std::cerr << "Error: " << (err ? err->message : "could not load manifest '" + manifest + "'") << "\n";
        }
        return plan;
    }
    auto plan = svc.cmd_preset(preset);
    if (!plan) {
        std::cerr << "Error: Unknown preset '" << preset << "'. Available:";
        for (const auto& n : ks::preset_names()) std::cerr << " " << n;
        std::cerr << "\n";
    }
    return plan;
}

void apply_config_settings(ks::StartupPlan& plan, const CliConfig& config) {
    for (const auto& [name, text] : config.settings) {
        try {
            plan.override_setting(name, ks::Options::parse_value(name, text));
        } catch (const ks::LoaderError& e) {
            std::cerr << "Warning: Ignoring config setting '" << name << "': " << e.what() << "\n";
        }
    }
    plan.manager.name = config.manager_name;
    plan.manager.url = config.manager_url;
    plan.manager.channel = config.manager_channel;
}

ks::Environment make_environment(const CliConfig& config, bool bootstrap) {
    ks::Environment env;
    env.data_dir = expand_home(config.data_dir);
    for (const auto& d : config.extension_dirs) env.extension_dirs.push_back(expand_home(d));
    env.bootstrap = bootstrap && config.auto_bootstrap;
    env.fetch_command = config.fetch_command;
    return env;
}

bool run_session_startup(ks::InteractionService& svc, CliSession& session, const CliConfig& config) {
    svc.cmd_set_environment(make_environment(config, session.bootstrap));
    auto report = svc.cmd_startup(session.plan);
    if (!report) {
        flush_messages(svc, session, ks::MessageLevel::Warning);
        return false;
    }
    for (const auto& dir : report->load.missing_dirs)
        std::cerr << "Warning: Extension directory not found: " << dir << "\n";
    flush_messages(svc, session, ks::MessageLevel::Warning);

    std::cout << "Started '" << report->plan << "': " << report->active_count() << "/"
              << report->extensions.size() << " extension(s) active, "
              << svc.cmd_active_servers().size() << " server(s), "
              << svc.cmd_bindings().size() << " binding(s)";
    if (report->bootstrap && report->bootstrap->fetched) std::cout << ", manager installed";
    std::cout << ".\n";
    return true;
}

// Owner -> library path, shaped by keys_source_mode. Built-in owners keep their name.
std::map<std::string, std::string> owner_display_paths(ks::InteractionService& svc, const CliConfig& config) {
    std::map<std::string, std::string> out;
    for (const auto& [cap, source] : svc.cmd_capability_sources()) {
        if (source == "built-in") continue;
        if (config.keys_source_mode == "absolute_path") out[cap] = source;
        else if (config.keys_source_mode == "relative_path") {
            std::error_code ec;
            auto rel = fs::relative(source, ec);
            out[cap] = ec ? source : rel.string();
        }
        else out[cap] = fs::path(source).filename().string();
    }
    return out;
}
