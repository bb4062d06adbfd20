// FILE: src/cli/command/command_diag.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/render_tables.hpp"

bool handle_diag(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& /*session*/,
                 CliConfig& config) {
    std::string sub;
    int buffer = 0;
    if (!(iss >> sub)) { print_help_diag(config); return true; }

    if (sub == "add") {
        ks::Diagnostic d;
        std::string severity;
        if (!(iss >> buffer >> d.line >> d.col >> severity)) {
            std::cout << "Usage: diag add <buffer> <line> <col> <severity> <message>\n";
            return true;
        }
        auto sev = ks::severity_from_name(severity);
        if (!sev) { std::cout << "Error: Unknown severity '" << severity << "'. Use error, warn, info or hint.\n"; return true; }
        d.severity = *sev;
        std::getline(iss >> std::ws, d.message);
        svc.cmd_add_diagnostic(buffer, d);
        auto vt = svc.cmd_virtual_text(d);
        if (!vt.empty()) std::cout << "  " << vt << "\n";
        return true;
    }
    if (sub == "clear") {
        if (!(iss >> buffer)) { std::cout << "Usage: diag clear <buffer>\n"; return true; }
        svc.cmd_clear_diagnostics(buffer);
        return true;
    }
    if (sub == "list") {
        if (!(iss >> buffer)) { std::cout << "Usage: diag list <buffer>\n"; return true; }
        auto items = svc.cmd_diagnostics(buffer);
        if (items.empty()) { std::cout << "No diagnostics for buffer " << buffer << ".\n"; return true; }
        std::cout << render_diagnostic_table(items, svc);
        return true;
    }
    if (sub == "loclist") {
        const auto& items = svc.cmd_location_list();
        if (items.empty()) { std::cout << "Location list is empty.\n"; return true; }
        std::cout << render_diagnostic_table(items, svc);
        return true;
    }
    std::cout << "Error: Unknown subcommand 'diag " << sub << "'. See 'help diag'.\n";
    return true;
}

void print_help_diag(const CliConfig& /*config*/) {
    print_help_from_file("help_diag.txt");
}
