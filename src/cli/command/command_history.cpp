// FILE: src/cli/command/command_history.cpp
#include <iostream>
#include <sstream>

#include "cli/cli_history.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_history(std::istringstream& iss,
                    ks::InteractionService& /*svc*/,
                    CliSession& /*session*/,
                    CliConfig& config) {
    size_t count = 20;
    size_t requested = 0;
    if (iss >> requested) count = requested;
    ks::CliHistory history;
    history.SetMaxSize(config.history_size);
    for (const auto& line : history.Recent(count)) std::cout << "  " << line << "\n";
    return true;
}

void print_help_history(const CliConfig& /*config*/) {
    print_help_from_file("help_history.txt");
}
