#include "ks_types.hpp"
#include <algorithm>

namespace ks {

const char* errc_name(LoaderErrc code) {
    switch (code) {
        case LoaderErrc::NotFound: return "not_found";
        case LoaderErrc::Io: return "io";
        case LoaderErrc::InvalidYaml: return "invalid_yaml";
        case LoaderErrc::InvalidSetting: return "invalid_setting";
        case LoaderErrc::InvalidBinding: return "invalid_binding";
        case LoaderErrc::MissingCapability: return "missing_capability";
        case LoaderErrc::SetupFailed: return "setup_failed";
        case LoaderErrc::BootstrapFailed: return "bootstrap_failed";
        case LoaderErrc::Unknown: break;
    }
    return "unknown";
}

std::string setting_to_string(const SettingValue& value) {
    if (auto b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (auto i = std::get_if<int>(&value)) return std::to_string(*i);
    return std::get<std::string>(value);
}

const char* level_name(MessageLevel level) {
    switch (level) {
        case MessageLevel::Debug: return "debug";
        case MessageLevel::Info: return "info";
        case MessageLevel::Warning: return "warning";
        case MessageLevel::Error: return "error";
    }
    return "info";
}

std::optional<Mode> mode_from_char(char c) {
    switch (c) {
        case 'n': return Mode::Normal;
        case 'i': return Mode::Insert;
        case 'v': return Mode::Visual;
        case 's': return Mode::Select;
        case 'c': return Mode::CommandLine;
        case 'o': return Mode::OperatorPending;
        default: return std::nullopt;
    }
}

char mode_to_char(Mode mode) {
    switch (mode) {
        case Mode::Normal: return 'n';
        case Mode::Insert: return 'i';
        case Mode::Visual: return 'v';
        case Mode::Select: return 's';
        case Mode::CommandLine: return 'c';
        case Mode::OperatorPending: return 'o';
    }
    return 'n';
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "normal";
        case Mode::Insert: return "insert";
        case Mode::Visual: return "visual";
        case Mode::Select: return "select";
        case Mode::CommandLine: return "command-line";
        case Mode::OperatorPending: return "operator-pending";
    }
    return "normal";
}

std::optional<std::vector<Mode>> parse_mode_set(const std::string& modes) {
    if (modes.empty()) return std::nullopt;
    std::vector<Mode> out;
    for (char c : modes) {
        auto m = mode_from_char(c);
        if (!m) return std::nullopt;
        if (std::find(out.begin(), out.end(), *m) == out.end()) out.push_back(*m);
    }
    return out;
}

std::string mode_set_to_string(const std::vector<Mode>& modes) {
    std::string out;
    for (auto m : modes) out.push_back(mode_to_char(m));
    return out;
}

const char* role_name(ExtensionRole role) {
    switch (role) {
        case ExtensionRole::FuzzyFinder: return "fuzzy_finder";
        case ExtensionRole::SyntaxTree: return "syntax_tree";
        case ExtensionRole::LanguageClient: return "language_client";
        case ExtensionRole::CompletionCapabilities: return "completion_capabilities";
        case ExtensionRole::Completion: return "completion";
        case ExtensionRole::Snippet: return "snippet";
        case ExtensionRole::Custom: return "custom";
    }
    return "custom";
}

std::optional<ExtensionRole> role_from_name(const std::string& name) {
    for (auto role : {ExtensionRole::FuzzyFinder, ExtensionRole::SyntaxTree,
                      ExtensionRole::LanguageClient, ExtensionRole::CompletionCapabilities,
                      ExtensionRole::Completion, ExtensionRole::Snippet, ExtensionRole::Custom}) {
        if (name == role_name(role)) return role;
    }
    return std::nullopt;
}

const char* state_name(ExtensionState state) {
    switch (state) {
        case ExtensionState::Declared: return "declared";
        case ExtensionState::Probing: return "probing";
        case ExtensionState::Active: return "active";
        case ExtensionState::Inactive: return "inactive";
    }
    return "declared";
}

} // namespace ks
