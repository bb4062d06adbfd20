// FILE: src/cli/command/command_help.cpp
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/print_repl_help.hpp"

// Helper to canonicalize command names and aliases
static std::string canonicalize(const std::string& cmd) {
  static const std::unordered_map<std::string, std::string> alias = {
      {"cls", "clear"}, {"q", "exit"}, {"quit", "exit"}, {"extensions", "ext"}};
  auto it = alias.find(cmd);
  return (it == alias.end()) ? cmd : it->second;
}

// Dispatcher for printing specific command help
static bool dispatch_print(const std::string& name, const CliConfig& config) {
  using PrintFn = void (*)(const CliConfig&);
  static const std::unordered_map<std::string, PrintFn> table = {
      {"help", print_help_help},         {"clear", print_help_clear},
      {"keys", print_help_keys},         {"ext", print_help_ext},
      {"servers", print_help_servers},   {"set", print_help_set},
      {"get", print_help_get},           {"press", print_help_press},
      {"attach", print_help_attach},     {"diag", print_help_diag},
      {"cursor", print_help_cursor},     {"reload", print_help_reload},
      {"save", print_help_save},         {"json", print_help_json},
      {"messages", print_help_messages}, {"config", print_help_config},
      {"history", print_help_history},   {"exit", print_help_exit},
  };
  auto it = table.find(canonicalize(name));
  if (it == table.end()) return false;
  it->second(config);
  return true;
}

bool handle_help(std::istringstream& iss,
                 ks::InteractionService& /*svc*/,
                 CliSession& /*session*/,
                 CliConfig& config) {
  std::string topic;
  iss >> topic;
  if (topic.empty()) {
    print_repl_help(config);
  } else if (!dispatch_print(topic, config)) {
    std::cout << "No help for '" << topic << "'. Type 'help' for a list of commands.\n";
  }
  return true;
}

void print_help_help(const CliConfig& /*config*/) {
  print_help_from_file("help_help.txt");
}
