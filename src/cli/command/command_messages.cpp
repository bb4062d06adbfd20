// FILE: src/cli/command/command_messages.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_messages(std::istringstream& iss,
                     ks::InteractionService& svc,
                     CliSession& session,
                     CliConfig& /*config*/) {
    std::string arg;
    iss >> arg;
    const bool all = arg == "all";
    // Pick up anything not printed yet without echoing it twice.
    for (auto& m : svc.cmd_drain_messages()) session.log.push_back(std::move(m));

    int shown = 0;
    for (const auto& m : session.log) {
        if (!all && m.level == ks::MessageLevel::Debug) continue;
        std::cout << "[" << ks::level_name(m.level) << "] " << m.text << "\n";
        ++shown;
    }
    if (shown == 0) std::cout << "No messages.\n";
    return true;
}

void print_help_messages(const CliConfig& /*config*/) {
    print_help_from_file("help_messages.txt");
}
