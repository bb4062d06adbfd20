// FILE: include/cli/command/commands.hpp
#pragma once

#include <sstream>
#include <string>

#include "cli/session.hpp"
#include "cli_config.hpp"
#include "kernel/interaction.hpp"

// Each command exposes two functions:
//  - handle_<command>: executes the command; returns whether to continue the REPL
//  - print_help_<command>: prints detailed help for the command

// help
bool handle_help(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& config);
void print_help_help(const CliConfig& config);

// clear / cls
bool handle_clear(std::istringstream& iss,
                  ks::InteractionService& svc,
                  CliSession& session,
                  CliConfig& config);
void print_help_clear(const CliConfig& config);

// keys [all|<modes>] [buf <n>]
bool handle_keys(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& config);
void print_help_keys(const CliConfig& config);

// ext [load <dir>|unload <path>|all|sources]
bool handle_ext(std::istringstream& iss,
                ks::InteractionService& svc,
                CliSession& session,
                CliConfig& config);
void print_help_ext(const CliConfig& config);

// servers
bool handle_servers(std::istringstream& iss,
                    ks::InteractionService& svc,
                    CliSession& session,
                    CliConfig& config);
void print_help_servers(const CliConfig& config);

// set <option> <value>
bool handle_set(std::istringstream& iss,
                ks::InteractionService& svc,
                CliSession& session,
                CliConfig& config);
void print_help_set(const CliConfig& config);

// get <option> [buffer]
bool handle_get(std::istringstream& iss,
                ks::InteractionService& svc,
                CliSession& session,
                CliConfig& config);
void print_help_get(const CliConfig& config);

// press <mode> <keys> [buffer]
bool handle_press(std::istringstream& iss,
                  ks::InteractionService& svc,
                  CliSession& session,
                  CliConfig& config);
void print_help_press(const CliConfig& config);

// attach <buffer> <filetype>
bool handle_attach(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& session,
                   CliConfig& config);
void print_help_attach(const CliConfig& config);

// diag add|clear|list|loclist
bool handle_diag(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& config);
void print_help_diag(const CliConfig& config);

// cursor <buffer> [line]
bool handle_cursor(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& session,
                   CliConfig& config);
void print_help_cursor(const CliConfig& config);

// reload [preset <name>|manifest <file>]
bool handle_reload(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& session,
                   CliConfig& config);
void print_help_reload(const CliConfig& config);

// save <file>
bool handle_save(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& config);
void print_help_save(const CliConfig& config);

// json <file>
bool handle_json(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& config);
void print_help_json(const CliConfig& config);

// messages [all]
bool handle_messages(std::istringstream& iss,
                     ks::InteractionService& svc,
                     CliSession& session,
                     CliConfig& config);
void print_help_messages(const CliConfig& config);

// config [show|set|save]
bool handle_config(std::istringstream& iss,
                   ks::InteractionService& svc,
                   CliSession& session,
                   CliConfig& config);
void print_help_config(const CliConfig& config);

// history [n]
bool handle_history(std::istringstream& iss,
                    ks::InteractionService& svc,
                    CliSession& session,
                    CliConfig& config);
void print_help_history(const CliConfig& config);

// exit / quit / q
bool handle_exit(std::istringstream& iss,
                 ks::InteractionService& svc,
                 CliSession& session,
                 CliConfig& config);
void print_help_exit(const CliConfig& config);
