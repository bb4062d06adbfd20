// FILE: src/cli/run_repl.cpp
#include <iostream>
#include <string>

#include <unistd.h>

#include "cli/cli_history.hpp"
#include "cli/process_command.hpp"
#include "cli/run_repl.hpp"

void run_repl(ks::InteractionService& svc, CliConfig& config, CliSession& session) {
    ks::CliHistory history;
    history.SetMaxSize(config.history_size);

    // Piped input (scripts, tests) gets no banner and no prompt.
    const bool interactive = isatty(STDIN_FILENO) != 0;
    if (interactive) {
        std::cout << "Keystrap shell. Type 'help' for commands.\n";
        std::cout << "History file: " << history.Path() << "\n";
    }

    std::string line;
    while (true) {
        if (interactive) std::cout << "ks> " << std::flush;
        if (!std::getline(std::cin, line)) {
            if (interactive) std::cout << "\n";
            return;
        }
        if (interactive && !line.empty()) {
            history.Add(line);
            history.Save();
        }
        if (!process_command(line, svc, session, config)) return;
    }
}
