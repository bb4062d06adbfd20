// FILE: src/cli/process_command.cpp
#include "cli/process_command.hpp"

#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

bool process_command(const std::string& line, ks::InteractionService& svc,
                     CliSession& session, CliConfig& config) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if (cmd.empty() || cmd[0] == '#')
    return true;
  try {
    if (cmd == "help") {
      return handle_help(iss, svc, session, config);
    } else if (cmd == "clear" || cmd == "cls") {
      return handle_clear(iss, svc, session, config);
    } else if (cmd == "keys") {
      return handle_keys(iss, svc, session, config);
    } else if (cmd == "ext" || cmd == "extensions") {
      return handle_ext(iss, svc, session, config);
    } else if (cmd == "servers") {
      return handle_servers(iss, svc, session, config);
    } else if (cmd == "set") {
      return handle_set(iss, svc, session, config);
    } else if (cmd == "get") {
      return handle_get(iss, svc, session, config);
    } else if (cmd == "press") {
      return handle_press(iss, svc, session, config);
    } else if (cmd == "attach") {
      return handle_attach(iss, svc, session, config);
    } else if (cmd == "diag") {
      return handle_diag(iss, svc, session, config);
    } else if (cmd == "cursor") {
      return handle_cursor(iss, svc, session, config);
    } else if (cmd == "reload") {
      return handle_reload(iss, svc, session, config);
    } else if (cmd == "save") {
      return handle_save(iss, svc, session, config);
    } else if (cmd == "json") {
      return handle_json(iss, svc, session, config);
    } else if (cmd == "messages") {
      return handle_messages(iss, svc, session, config);
    } else if (cmd == "config") {
      return handle_config(iss, svc, session, config);
    } else if (cmd == "history") {
      return handle_history(iss, svc, session, config);
    } else if (cmd == "exit" || cmd == "quit" || cmd == "q") {
      return handle_exit(iss, svc, session, config);
    } else {
      std::cout << "Unknown command: " << cmd
                << ". Type 'help' for a list of commands.\n";
    }
  } catch (const std::exception& e) {
    std::cout << "Error: " << e.what() << "\n";
  }
  return true;
}
