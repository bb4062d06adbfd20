// FILE: src/cli/command/command_keys.cpp
#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/render_tables.hpp"

bool handle_keys(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& /*session*/,
                 CliConfig& config) {
    std::string mode_arg = config.default_keys_mode;
    std::optional<int> buffer;
    std::string tok;
    while (iss >> tok) {
        if (tok == "buf") {
            int b = 0;
            if (!(iss >> b)) { std::cout << "Error: 'buf' needs a buffer number.\n"; return true; }
            buffer = b;
        } else {
            mode_arg = tok;
        }
    }

    std::optional<std::vector<ks::Mode>> modes;
    if (mode_arg != "all") {
        modes = ks::parse_mode_set(mode_arg);
        if (!modes) { std::cout << "Error: Invalid mode set '" << mode_arg << "'. Use letters from 'nivsco' or 'all'.\n"; return true; }
    }

    std::vector<ks::Binding> shown;
    for (const auto& b : svc.cmd_bindings()) {
        if (modes && std::find(modes->begin(), modes->end(), b.key.mode) == modes->end()) continue;
        if (b.key.buffer && b.key.buffer != buffer) continue;
        shown.push_back(b);
    }
    if (shown.empty()) { std::cout << "No bindings registered.\n"; return true; }

    if (config.keys_source_mode == "name_only") {
        std::cout << render_key_table(shown);
    } else {
        auto paths = owner_display_paths(svc, config);
        std::cout << render_key_table(shown, &paths);
    }
    std::cout << shown.size() << " binding(s).\n";
    return true;
}

void print_help_keys(const CliConfig& /*config*/) {
    print_help_from_file("help_keys.txt");
}
