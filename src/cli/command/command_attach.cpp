// FILE: src/cli/command/command_attach.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_attach(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& session,
                   CliConfig& /*config*/) {
    int buffer = 0;
    std::string filetype;
    if (!(iss >> buffer >> filetype)) { std::cout << "Usage: attach <buffer> <filetype>\n"; return true; }
    auto servers = svc.cmd_attach(buffer, filetype);
    flush_messages(svc, session);
    if (servers.empty()) {
        std::cout << "No active language server handles '" << filetype << "'.\n";
        return true;
    }
    std::cout << "Buffer " << buffer << " attached to";
    for (const auto& s : servers) std::cout << " " << s;
    std::cout << ".\n";
    return true;
}

void print_help_attach(const CliConfig& /*config*/) {
    print_help_from_file("help_attach.txt");
}
