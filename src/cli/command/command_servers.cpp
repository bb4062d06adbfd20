// FILE: src/cli/command/command_servers.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/render_tables.hpp"

bool handle_servers(std::istringstream& /*iss*/,
                    ks::InteractionService& svc,
                    CliSession& /*session*/,
                    CliConfig& /*config*/) {
    const auto& report = svc.cmd_last_report();
    if (!report || report->servers.empty()) {
        std::cout << "No language servers configured.\n";
        return true;
    }
    std::cout << render_server_table(*report);
    std::cout << "Client capabilities: " << (report->capabilities_contributed ? "extended by completion source" : "defaults")
              << "\n";
    return true;
}

void print_help_servers(const CliConfig& /*config*/) {
    print_help_from_file("help_servers.txt");
}
