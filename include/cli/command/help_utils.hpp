// FILE: include/cli/command/help_utils.hpp
#pragma once
#include <string>

#include "cli_config.hpp"

// Print help text from KEYSTRAP_HELP_DIR/<filename> (the source tree's
// src/cli/command/help by default). If the file cannot be opened, prints a
// default message.
void print_help_from_file(const std::string& filename);
