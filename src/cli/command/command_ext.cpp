// FILE: src/cli/command/command_ext.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/render_tables.hpp"

bool handle_ext(std::istringstream& iss,
                ks::InteractionService& svc,
                CliSession& /*session*/,
                CliConfig& config) {
    std::string sub;
    iss >> sub;
    if (sub.empty()) {
        const auto& report = svc.cmd_last_report();
        if (!report || report->extensions.empty()) { std::cout << "No extensions declared.\n"; return true; }
        std::cout << render_extension_table(*report);
        return true;
    }
    if (sub == "sources") {
        auto paths = owner_display_paths(svc, config);
        for (const auto& cap : svc.cmd_capabilities()) {
            auto it = paths.find(cap);
            std::cout << "  - " << cap << "  [" << (it == paths.end() ? "built-in" : it->second) << "]\n";
        }
        return true;
    }
    if (sub == "load") {
        std::string dir;
        if (!(iss >> dir)) { std::cout << "Usage: ext load <dir>\n"; return true; }
        auto r = svc.cmd_extensions_load_report({dir});
        std::cout << "Loaded " << r.loaded << "/" << r.attempted << " librar" << (r.attempted == 1 ? "y" : "ies")
                  << ", " << r.new_capabilities.size() << " new capabilit" << (r.new_capabilities.size() == 1 ? "y" : "ies")
                  << ".\n";
        for (const auto& name : r.new_capabilities) std::cout << "  + " << name << "\n";
        for (const auto& e : r.errors) std::cerr << "Warning: " << e.path << ": " << e.message << "\n";
        for (const auto& d : r.missing_dirs) std::cerr << "Warning: Directory not found: " << d << "\n";
        std::cout << "Run 'reload' to activate them.\n";
        return true;
    }
    if (sub == "unload") {
        std::string target;
        if (!(iss >> target)) { std::cout << "Usage: ext unload <library-path>|all\n"; return true; }
        int removed = target == "all" ? svc.cmd_extensions_unload_all() : svc.cmd_extensions_unload(target);
        std::cout << "Unregistered " << removed << " capabilit" << (removed == 1 ? "y" : "ies") << ".\n";
        return true;
    }
    std::cout << "Error: Unknown subcommand 'ext " << sub << "'. See 'help ext'.\n";
    return true;
}

void print_help_ext(const CliConfig& /*config*/) {
    print_help_from_file("help_ext.txt");
}
