#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace ks {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(KEYSTRAP_LIB_BUILD)
        #define KEYSTRAP_API __declspec(dllexport)
    #else
        #define KEYSTRAP_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(KEYSTRAP_LIB_BUILD)
        #define KEYSTRAP_API __attribute__((visibility("default")))
    #else
        #define KEYSTRAP_API
    #endif
#endif

enum class LoaderErrc {
    Unknown = 1, NotFound, Io, InvalidYaml, InvalidSetting,
    InvalidBinding, MissingCapability, SetupFailed, BootstrapFailed,
};
struct KEYSTRAP_API LoaderError : public std::runtime_error {
    explicit LoaderError(const std::string& what)
        : std::runtime_error(what), code_(LoaderErrc::Unknown) {}
    LoaderError(LoaderErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    LoaderErrc code() const noexcept { return code_; }
private:
    LoaderErrc code_;
};

const char* errc_name(LoaderErrc code);

// A setting value: boolean, integer or string, nothing else.
using SettingValue = std::variant<bool, int, std::string>;

std::string setting_to_string(const SettingValue& value);

enum class MessageLevel { Debug, Info, Warning, Error };

const char* level_name(MessageLevel level);

// Editor modes a trigger can be bound in. Single-letter names follow the
// usual modal-editor convention: n i v s c o.
enum class Mode { Normal, Insert, Visual, Select, CommandLine, OperatorPending };

std::optional<Mode> mode_from_char(char c);
char mode_to_char(Mode mode);
const char* mode_name(Mode mode);
// Parses a mode set such as "n" or "is". Returns nullopt on an unknown
// letter or an empty string. Duplicates are collapsed, order is kept.
std::optional<std::vector<Mode>> parse_mode_set(const std::string& modes);
std::string mode_set_to_string(const std::vector<Mode>& modes);

// Roles of the extensions the loader knows how to wire. Each role is
// resolved once per startup to an active handle or to nothing.
enum class ExtensionRole {
    FuzzyFinder,
    SyntaxTree,
    LanguageClient,
    CompletionCapabilities,
    Completion,
    Snippet,
    Custom,
};

const char* role_name(ExtensionRole role);
std::optional<ExtensionRole> role_from_name(const std::string& name);

enum class ExtensionState { Declared, Probing, Active, Inactive };

const char* state_name(ExtensionState state);

} // namespace ks
