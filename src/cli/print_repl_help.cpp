// FILE: src/cli/print_repl_help.cpp
#include <iostream>
#include "cli/print_repl_help.hpp"

void print_repl_help(const CliConfig& config) {
    std::cout << "Available REPL (interactive shell) commands:\n\n"
              << "  help [command]\n"
              << "    Show this help message, or detailed help for one command.\n\n"

              << "  clear\n"
              << "    Clear the terminal screen.\n\n"

              << "  keys [all|<modes>] [buf <n>]\n"
              << "    Print the trigger table (default modes: " << config.default_keys_mode << ").\n\n"

              << "  ext [sources|load <dir>|unload <path>|all]\n"
              << "    Show extension states, or manage extension libraries.\n\n"

              << "  servers\n"
              << "    Show language server setup results.\n\n"

              << "  set <option> <value> | get [option] [buffer]\n"
              << "    Change or show editor options.\n\n"

              << "  press <mode> <keys> [buffer]\n"
              << "    Feed keys and run the bound action.\n\n"

              << "  attach <buffer> <filetype>\n"
              << "    Attach language servers to a buffer.\n\n"

              << "  diag add|clear|list|loclist ...\n"
              << "    Publish and inspect diagnostics.\n\n"

              << "  cursor <buffer> [line]\n"
              << "    Show or move a buffer's cursor line.\n\n"

              << "  reload [preset <name>|manifest <file>]\n"
              << "    Run startup again from empty tables.\n\n"

              << "  save <file>\n"
              << "    Write the current plan as a YAML manifest.\n\n"

              << "  json [file]\n"
              << "    Dump the loader state as JSON.\n\n"

              << "  messages [all]\n"
              << "    Show messages; 'all' includes debug output.\n\n"

              << "  config [show|set <field> <value>|save [file]]\n"
              << "    Inspect or edit the CLI configuration.\n\n"

              << "  history [n]\n"
              << "    Show recent shell input.\n\n"

              << "  exit\n"
              << "    Leave the shell.\n"
              << std::endl;
}
