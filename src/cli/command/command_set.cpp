// FILE: src/cli/command/command_set.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_set(std::istringstream& iss,
                ks::InteractionService& svc,
                CliSession& session,
                CliConfig& /*config*/) {
    std::string name;
    if (!(iss >> name)) { std::cout << "Usage: set <option> <value>\n"; return true; }
    std::string value;
    std::getline(iss >> std::ws, value);
    if (svc.cmd_set_option(name, value)) {
        // Later reloads keep the value.
        session.plan.override_setting(name, svc.cmd_options().get(name));
        std::cout << name << " = " << ks::setting_to_string(svc.cmd_options().get(name)) << "\n";
    } else {
        auto err = svc.cmd_last_error();
        std::cout << "Error: " << (err ? err->message : "could not set '" + name + "'") << "\n";
    }
    return true;
}

void print_help_set(const CliConfig& /*config*/) {
    print_help_from_file("help_set.txt");
}
