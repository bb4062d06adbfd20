// FILE: src/cli/command/command_reload.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_reload(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& session,
                   CliConfig& config) {
    std::string kind, arg;
    iss >> kind >> arg;
    if (!kind.empty()) {
        if ((kind != "preset" && kind != "manifest") || arg.empty()) {
            std::cout << "Usage: reload [preset <name>|manifest <file>]\n";
            return true;
        }
        auto plan = kind == "preset" ? resolve_plan(svc, "", arg) : resolve_plan(svc, arg, "");
        if (!plan) return true;
        apply_config_settings(*plan, config);
        session.plan = std::move(*plan);
    }
    if (!run_session_startup(svc, session, config)) {
        auto err = svc.cmd_last_error();
        std::cout << "Error: Startup aborted: " << (err ? err->message : "unknown error") << "\n";
    }
    return true;
}

void print_help_reload(const CliConfig& /*config*/) {
    print_help_from_file("help_reload.txt");
}
