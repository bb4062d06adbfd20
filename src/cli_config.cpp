// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include "ks_types.hpp"

using namespace ks; // for fs

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Keystrap CLI configuration.";
    root["data_dir"] = config.data_dir;
    root["extension_dirs"] = config.extension_dirs;
    root["manager_name"] = config.manager_name;
    root["manager_url"] = config.manager_url;
    root["manager_channel"] = config.manager_channel;
    root["fetch_command"] = config.fetch_command;
    root["auto_bootstrap"] = config.auto_bootstrap;
    root["preset"] = config.preset;
    root["manifest_path"] = config.manifest_path;
    root["default_keys_mode"] = config.default_keys_mode;
    root["keys_source_mode"] = config.keys_source_mode;
    root["history_size"] = config.history_size;
    root["settings"] = YAML::Node(YAML::NodeType::Map);
    for (const auto& [name, value] : config.settings) root["settings"][name] = value;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["data_dir"]) config.data_dir = root["data_dir"].as<std::string>();
            if (root["extension_dirs"] && root["extension_dirs"].IsSequence()) {
                config.extension_dirs = root["extension_dirs"].as<std::vector<std::string>>();
            } else if (root["extension_dir"] && root["extension_dir"].IsScalar()) {
                config.extension_dirs.clear();
                config.extension_dirs.push_back(root["extension_dir"].as<std::string>());
            }
            if (root["manager_name"]) config.manager_name = root["manager_name"].as<std::string>();
            if (root["manager_url"]) config.manager_url = root["manager_url"].as<std::string>();
            if (root["manager_channel"]) config.manager_channel = root["manager_channel"].as<std::string>();
            if (root["fetch_command"]) config.fetch_command = root["fetch_command"].as<std::string>();
            if (root["auto_bootstrap"]) config.auto_bootstrap = root["auto_bootstrap"].as<bool>();
            if (root["preset"]) config.preset = root["preset"].as<std::string>();
            if (root["manifest_path"]) config.manifest_path = root["manifest_path"].as<std::string>();
            if (root["default_keys_mode"]) config.default_keys_mode = root["default_keys_mode"].as<std::string>();
            if (root["keys_source_mode"]) config.keys_source_mode = root["keys_source_mode"].as<std::string>();
            if (root["history_size"]) config.history_size = root["history_size"].as<int>();
            if (root["settings"] && root["settings"].IsMap()) {
                config.settings.clear();
                for (const auto& kv : root["settings"])
                    config.settings[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        } else {
            std::cerr << "Warning: Could not write default 'config.yaml'." << std::endl;
        }
    } else {
        std::cerr << "Warning: Config file '" << config_path << "' not found. Using default settings." << std::endl;
    }
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}
