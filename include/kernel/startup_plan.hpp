// Keystrap kernel: declarative startup plan
#pragma once

#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "kernel/diagnostics.hpp"
#include "ks_types.hpp"

namespace ks {

// "builtin" for host actions, otherwise a capability name.
inline constexpr const char* kBuiltinOwner = "builtin";

struct ActionRef {
    std::string owner;
    std::string name;
};

struct BindingSpec {
    std::string modes = "n";
    std::string lhs;
    // First entry is the primary action; further entries form a chain whose
    // steps are dropped when their owner is inactive.
    std::vector<ActionRef> action;
    std::string desc;
    bool silent = false;
};

struct ExtensionDescriptor {
    ExtensionRole role = ExtensionRole::Custom;
    std::string capability;
    YAML::Node options;
    std::vector<BindingSpec> bindings;
};

struct LanguageClientPlan {
    std::vector<std::string> servers;
    int debounce_text_changes_ms = 100;
    std::string capability_provider = "cmp_nvim_lsp";
    DiagnosticsConfig diagnostics;
    // Installed buffer-locally when a server attaches to a buffer.
    std::vector<BindingSpec> attach_bindings;
};

struct ManagerSpec {
    bool enabled = true;
    std::string name = "lazy.nvim";
    std::string url = "https://github.com/folke/lazy.nvim.git";
    std::string channel = "stable";
};

struct PluginSpec {
    std::string repo;  // owner/name
    std::vector<std::string> dependencies;

    // Directory name under <data_dir>/lazy.
    static std::string dir_name(const std::string& repo);
};

struct StartupPlan {
    std::string name;
    std::vector<std::pair<std::string, SettingValue>> settings;
    ManagerSpec manager;
    std::vector<PluginSpec> plugins;
    std::vector<ExtensionDescriptor> extensions;
    LanguageClientPlan language_client;
    // Host bindings registered after every extension.
    std::vector<BindingSpec> bindings;

    // Appends or replaces a setting, keeping first-seen order.
    void override_setting(const std::string& name, const SettingValue& value);
};

} // namespace ks
