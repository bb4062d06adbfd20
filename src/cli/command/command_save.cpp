// FILE: src/cli/command/command_save.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_save(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& /*config*/) {
    std::string path;
    if (!(iss >> path)) { std::cout << "Usage: save <file.yaml>\n"; return true; }
    if (svc.cmd_save_manifest(session.plan, path)) {
        std::cout << "Saved plan '" << session.plan.name << "' to " << path << "\n";
    } else {
        auto err = svc.cmd_last_error();
        std::cout << "Error: " << (err ? err->message : "could not write " + path) << "\n";
    }
    return true;
}

void print_help_save(const CliConfig& /*config*/) {
    print_help_from_file("help_save.txt");
}
