// FILE: src/cli/command/command_config.cpp
#include <filesystem>
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace fs = std::filesystem;

static void print_config(const CliConfig& config) {
    std::cout << "  loaded_config_path = " << (config.loaded_config_path.empty() ? "(none)" : config.loaded_config_path) << "\n"
              << "  data_dir = " << config.data_dir << "\n"
              << "  manager_name = " << config.manager_name << "\n"
              << "  manager_url = " << config.manager_url << "\n"
              << "  manager_channel = " << config.manager_channel << "\n"
              << "  fetch_command = " << config.fetch_command << "\n"
              << "  auto_bootstrap = " << (config.auto_bootstrap ? "true" : "false") << "\n"
              << "  preset = " << config.preset << "\n"
              << "  manifest_path = " << config.manifest_path << "\n"
              << "  default_keys_mode = " << config.default_keys_mode << "\n"
              << "  keys_source_mode = " << config.keys_source_mode << "\n"
              << "  history_size = " << config.history_size << "\n";
    for (size_t i = 0; i < config.extension_dirs.size(); ++i)
        std::cout << "  extension_dirs[" << i << "] = " << config.extension_dirs[i] << "\n";
    for (const auto& [name, value] : config.settings)
        std::cout << "  settings." << name << " = " << value << "\n";
}

// Returns false for an unknown field or a malformed value.
static bool set_field(CliConfig& config, const std::string& field, const std::string& value) {
    auto as_bool = [&](bool& out) {
        if (value == "true" || value == "yes" || value == "on") { out = true; return true; }
        if (value == "false" || value == "no" || value == "off") { out = false; return true; }
        return false;
    };
    if (field == "data_dir") config.data_dir = value;
    else if (field == "manager_name") config.manager_name = value;
    else if (field == "manager_url") config.manager_url = value;
    else if (field == "manager_channel") config.manager_channel = value;
    else if (field == "fetch_command") config.fetch_command = value;
    else if (field == "auto_bootstrap") return as_bool(config.auto_bootstrap);
    else if (field == "preset") config.preset = value;
    else if (field == "manifest_path") config.manifest_path = value;
    else if (field == "default_keys_mode") config.default_keys_mode = value;
    else if (field == "keys_source_mode") {
        if (value != "name_only" && value != "relative_path" && value != "absolute_path") return false;
        config.keys_source_mode = value;
    } else if (field == "history_size") {
        try { config.history_size = std::stoi(value); } catch (const std::exception&) { return false; }
    } else if (field == "extension_dirs") {
        config.extension_dirs.clear();
        std::istringstream dirs(value);
        std::string d;
        while (dirs >> d) config.extension_dirs.push_back(d);
    } else if (field.rfind("settings.", 0) == 0) {
        const auto name = field.substr(9);
        try {
            ks::Options::parse_value(name, value);
        } catch (const ks::LoaderError&) {
            return false;
        }
        config.settings[name] = value;
    } else {
        return false;
    }
    return true;
}

bool handle_config(std::istringstream& iss,
                   ks::InteractionService& /*svc*/,
                   CliSession& /*session*/,
                   CliConfig& config) {
    std::string sub;
    iss >> sub;
    if (sub.empty() || sub == "show") { print_config(config); return true; }
    if (sub == "set") {
        std::string field, value;
        iss >> field;
        std::getline(iss >> std::ws, value);
        if (field.empty() || !set_field(config, field, value)) {
            std::cout << "Error: Cannot set '" << field << "' to '" << value << "'. See 'help config'.\n";
            return true;
        }
        std::cout << "Applied to the current session; 'reload' to restart with it.\n";
        return true;
    }
    if (sub == "save") {
        std::string path;
        iss >> path;
        if (path.empty()) path = config.loaded_config_path.empty() ? "config.yaml" : config.loaded_config_path;
        if (write_config_to_file(config, path)) {
            config.loaded_config_path = fs::absolute(path).string();
            std::cout << "Configuration saved to " << path << std::endl;
        } else {
            std::cout << "Error: Failed to save configuration to " << path << std::endl;
        }
        return true;
    }
    std::cout << "Error: Unknown subcommand 'config " << sub << "'. See 'help config'.\n";
    return true;
}

void print_help_config(const CliConfig& /*config*/) {
    print_help_from_file("help_config.txt");
}
