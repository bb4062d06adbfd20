// Keystrap kernel: interfaces implemented by extensions and by the host
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "kernel/options.hpp"
#include "ks_types.hpp"

namespace ks {

// Services the host exposes to extensions during setup and dispatch.
class KEYSTRAP_API Host {
public:
    virtual ~Host() = default;
    virtual void message(MessageLevel level, const std::string& text) = 0;
    virtual const Options& options() const = 0;
    // True once `capability` reached the Active state in this startup run.
    virtual bool capability_active(const std::string& capability) const = 0;
};

struct ActionContext {
    Host& host;
    Mode mode = Mode::Normal;
    std::string keys;
    std::optional<int> buffer;
    int line = 0;
};

enum class ActionResult { Handled, NotApplicable };

class KEYSTRAP_API Extension {
public:
    virtual ~Extension() = default;

    virtual std::string name() const = 0;
    // Applies the extension's static options. Throwing leaves the
    // extension inactive.
    virtual void setup(const YAML::Node& options, Host& host) = 0;
    // Names accepted by invoke(); bindings are checked against this list.
    virtual std::vector<std::string> actions() const = 0;
    virtual ActionResult invoke(const std::string& action, ActionContext& ctx) = 0;
};

// Contributes to the client capability document a language client
// advertises to its servers (e.g. completion item support).
class KEYSTRAP_API CapabilityContributor : public Extension {
public:
    virtual void contribute(YAML::Node& client_capabilities) = 0;
};

// Shared by every server set up in one startup run.
struct ServerConfig {
    int debounce_text_changes_ms = 150;
    YAML::Node capabilities;
};

class KEYSTRAP_API LanguageClient : public Extension {
public:
    virtual bool has_server(const std::string& server) const = 0;
    // Throws when the server configuration cannot be applied.
    virtual void setup_server(const std::string& server, const ServerConfig& config) = 0;
    // Servers that were set up and handle `filetype`.
    virtual std::vector<std::string> servers_for_filetype(const std::string& filetype) const = 0;
};

// Default capability document the host advertises without contributions.
KEYSTRAP_API YAML::Node make_client_capabilities();

} // namespace ks
