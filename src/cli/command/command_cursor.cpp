// FILE: src/cli/command/command_cursor.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_cursor(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& /*session*/,
                   CliConfig& /*config*/) {
    int buffer = 0, line = 0;
    if (!(iss >> buffer)) { std::cout << "Usage: cursor <buffer> [line]\n"; return true; }
    if (iss >> line) {
        if (line < 1) { std::cout << "Error: Lines start at 1.\n"; return true; }
        svc.cmd_set_cursor(buffer, line);
    }
    std::cout << "Buffer " << buffer << ", line " << svc.cmd_cursor(buffer) << "\n";
    return true;
}

void print_help_cursor(const CliConfig& /*config*/) {
    print_help_from_file("help_cursor.txt");
}
