// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <map>
#include <string>
#include <vector>

// Kept in the global namespace; only the CLI front end uses it.
struct CliConfig {
    std::string loaded_config_path;
    // Root for the manager checkout and plugin directories ("~" expands).
    std::string data_dir = "~/.local/share/keystrap";
    std::vector<std::string> extension_dirs = {"build/extensions"};
    std::string manager_name = "lazy.nvim";
    std::string manager_url = "https://github.com/folke/lazy.nvim.git";
    std::string manager_channel = "stable";
    std::string fetch_command = "git";
    bool auto_bootstrap = true;
    // Preset used when no manifest is given.
    std::string preset = "lean";
    std::string manifest_path = "";
    // Mode filter for `keys` without an argument ("all" or a mode set such as "n").
    std::string default_keys_mode = "all";
    // Owner column of `keys` and `ext sources`: "name_only", "relative_path" or
    // "absolute_path" (library the owner was registered from).
    std::string keys_source_mode = "name_only";
    int history_size = 1000;
    // Option overrides applied on top of every plan, as text.
    std::map<std::string, std::string> settings;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// Replaces a leading "~" with $HOME.
std::string expand_home(const std::string& path);
