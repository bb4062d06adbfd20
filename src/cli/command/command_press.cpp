// FILE: src/cli/command/command_press.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_press(std::istringstream& iss,
                  ks::InteractionService& svc,
                  CliSession& session,
                  CliConfig& /*config*/) {
    std::string mode_arg, keys;
    if (!(iss >> mode_arg >> keys) || mode_arg.size() != 1) {
        std::cout << "Usage: press <mode> <keys> [buffer]\n";
        return true;
    }
    auto mode = ks::mode_from_char(mode_arg[0]);
    if (!mode) { std::cout << "Error: Unknown mode '" << mode_arg << "'.\n"; return true; }
    std::optional<int> buffer;
    int b = 0;
    if (iss >> b) buffer = b;

    auto result = svc.cmd_feed(*mode, keys, buffer);
    flush_messages(svc, session);
    switch (result.status) {
        case ks::DispatchStatus::Unmapped:
            std::cout << result.lhs << ": not mapped in " << ks::mode_name(*mode) << " mode.\n";
            break;
        case ks::DispatchStatus::Handled:
            std::cout << result.lhs << " -> " << result.action << "\n";
            break;
        case ks::DispatchStatus::Fallback:
            std::cout << result.lhs << " -> " << result.action << " (not applicable, key inserted literally)\n";
            break;
        case ks::DispatchStatus::Failed:
            std::cout << "Error: " << result.lhs << " -> " << result.action << " failed: " << result.detail << "\n";
            break;
    }
    return true;
}

void print_help_press(const CliConfig& /*config*/) {
    print_help_from_file("help_press.txt");
}
