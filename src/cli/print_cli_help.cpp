// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: keystrap_cli [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -P, --preset <name>        Start from a built-in plan (lean, truecolor)\n"
      << "  -m, --manifest <file>      Start from a YAML manifest\n"
      << "      --dump-manifest <file> Write the selected plan as YAML\n"
      << "  -k, --keys                 Print the trigger table after startup\n"
      << "  -x, --extensions           Print extension states after startup\n"
      << "  -j, --json <file>          Write the loader state as JSON\n"
      << "      --no-bootstrap         Do not fetch the plugin manager\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "  -R, --repl                 Start interactive shell (REPL)\n"
      << std::endl;
}
