// FILE: src/cli/command/command_get.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_get(std::istringstream& iss,
                ks::InteractionService& svc,
                CliSession& /*session*/,
                CliConfig& /*config*/) {
    std::string name;
    if (!(iss >> name)) {
        for (const auto& spec : ks::Options::schema()) {
            if (spec.scope != ks::Options::Scope::Global) continue;
            std::cout << "  " << spec.name << " = " << ks::setting_to_string(svc.cmd_options().get(spec.name)) << "\n";
        }
        return true;
    }
    int buffer = 0;
    if (iss >> buffer) {
        auto v = svc.cmd_get_local_option(buffer, name);
        if (v) std::cout << name << " = " << ks::setting_to_string(*v) << " (buffer " << buffer << ")\n";
        else std::cout << name << " is not set for buffer " << buffer << "\n";
        return true;
    }
    auto v = svc.cmd_get_option(name);
    if (!v) { std::cout << "Error: Unknown option '" << name << "'.\n"; return true; }
    std::cout << name << " = " << ks::setting_to_string(*v) << "\n";
    return true;
}

void print_help_get(const CliConfig& /*config*/) {
    print_help_from_file("help_get.txt");
}
