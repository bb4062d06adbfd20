// FILE: src/cli/command/command_json.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/state_json.hpp"

bool handle_json(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& /*session*/,
                 CliConfig& /*config*/) {
    std::string path;
    if (!(iss >> path)) {
        std::cout << state_to_json(svc).dump(2) << "\n";
        return true;
    }
    if (write_state_json(svc, path)) std::cout << "Wrote state to " << path << "\n";
    else std::cout << "Error: Could not write " << path << "\n";
    return true;
}

void print_help_json(const CliConfig& /*config*/) {
    print_help_from_file("help_json.txt");
}
