// Keystrap kernel: startup context and extension loader
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "kernel/bootstrap.hpp"
#include "kernel/capability_registry.hpp"
#include "kernel/diagnostics.hpp"
#include "kernel/extension.hpp"
#include "kernel/extension_manager.hpp"
#include "kernel/options.hpp"
#include "kernel/startup_plan.hpp"
#include "kernel/trigger_table.hpp"

namespace ks {

struct Environment {
    fs::path data_dir = ".";
    std::vector<std::string> extension_dirs;
    bool bootstrap = true;
    std::string fetch_command = "git";
};

struct ExtensionRecord {
    ExtensionRole role = ExtensionRole::Custom;
    std::string capability;
    ExtensionState state = ExtensionState::Declared;
    std::string reason;  // why the extension is inactive
    std::string source;  // "built-in", library path, or "" when unknown
    int bindings = 0;    // binding specs registered for it
};

struct ServerRecord {
    std::string name;
    bool active = false;
    std::string reason;
};

struct SkippedBinding {
    std::string owner;
    std::string modes;
    std::string lhs;
    std::string reason;
};

struct StartupReport {
    std::string plan;
    std::optional<BootstrapOutcome> bootstrap;
    ExtensionLoadResult load;
    std::vector<ExtensionRecord> extensions;
    std::vector<ServerRecord> servers;
    bool capabilities_contributed = false;
    std::vector<std::pair<std::string, std::string>> rejected_settings;  // name, reason
    std::vector<SkippedBinding> skipped_bindings;

    int active_count() const;
    const ExtensionRecord* find(const std::string& capability) const;
};

enum class DispatchStatus { Unmapped, Handled, Fallback, Failed };

const char* dispatch_status_name(DispatchStatus s);

struct DispatchResult {
    DispatchStatus status = DispatchStatus::Unmapped;
    std::string lhs;     // normalised keys that were looked up
    std::string action;  // describe_action() of the matched binding
    std::string detail;  // error text for Failed
};

// The explicit startup context: owns every table the loader writes and
// performs the single-pass startup sequence. A second run_startup() starts
// from empty tables.
class KEYSTRAP_API Kernel : public Host {
public:
    struct LastError { LoaderErrc code = LoaderErrc::Unknown; std::string message; };
    struct Message { MessageLevel level = MessageLevel::Info; std::string text; };

    explicit Kernel(Bootstrapper::Fetcher fetcher = {});
    ~Kernel() override;

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    void set_environment(Environment env) { env_ = std::move(env); }
    const Environment& environment() const { return env_; }

    // Throws LoaderError(BootstrapFailed) when the manager cannot be fetched;
    // every other failure is recorded in the report and skipped.
    StartupReport run_startup(const StartupPlan& plan);
    const std::optional<StartupReport>& last_report() const { return last_report_; }
    std::optional<LastError> last_error() const { return last_error_; }

    // Looks up `keys` (after normalisation) and runs the bound action.
    DispatchResult feed(Mode mode, const std::string& keys, std::optional<int> buffer = std::nullopt);

    // Attaches every active language server that handles `filetype`,
    // installing the attach bindings buffer-locally once per buffer.
    // Returns the attached servers.
    std::vector<std::string> attach_buffer(int buffer, const std::string& filetype);
    bool is_attached(int buffer) const { return attached_buffers_.count(buffer) > 0; }

    void set_cursor(int buffer, int line) { cursors_[buffer] = line; }
    int cursor(int buffer) const;
    const std::vector<Diagnostic>& location_list() const { return loclist_; }

    // Host
    void message(MessageLevel level, const std::string& text) override;
    const Options& options() const override { return options_; }
    bool capability_active(const std::string& capability) const override;

    Options& mutable_options() { return options_; }
    TriggerTable& triggers() { return triggers_; }
    const TriggerTable& triggers() const { return triggers_; }
    DiagnosticStore& diagnostics() { return diagnostics_; }
    const DiagnosticStore& diagnostics() const { return diagnostics_; }
    CapabilityRegistry& registry() { return registry_; }
    const CapabilityRegistry& registry() const { return registry_; }
    ExtensionManager& extensions() { return manager_; }
    const ExtensionManager& extensions() const { return manager_; }

    std::shared_ptr<Extension> active(ExtensionRole role) const;
    std::shared_ptr<Extension> active(const std::string& capability) const;
    const std::vector<std::string>& active_servers() const { return active_servers_; }
    const std::vector<fs::path>& runtime_path() const { return runtime_path_; }
    int bootstrap_attempts() const { return bootstrapper_.attempts(); }

    const std::vector<Message>& messages() const { return messages_; }
    void clear_messages() { messages_.clear(); }

private:
    void reset();
    void apply_settings(const StartupPlan& plan, StartupReport& report);
    std::vector<std::string> extension_dirs_for(const StartupPlan& plan) const;
    void process_descriptor(const ExtensionDescriptor& desc, const StartupPlan& plan, StartupReport& report);
    YAML::Node negotiate_capabilities(const LanguageClientPlan& plan, StartupReport& report);
    void configure_language_client(LanguageClient& client, const std::string& capability,
                                   const LanguageClientPlan& plan, const YAML::Node& capabilities,
                                   StartupReport& report);
    int register_bindings(const std::vector<BindingSpec>& specs, const std::string& default_owner,
                          std::optional<int> buffer, StartupReport* report);
    std::optional<Action> resolve_action(const BindingSpec& spec, const std::string& default_owner,
                                         std::string& reason);
    ActionResult run_step(const ExtensionAction& step, ActionContext& ctx);
    ActionResult run_builtin(BuiltinActionId id, ActionContext& ctx);

    CapabilityRegistry registry_;
    ExtensionManager manager_{registry_};
    Bootstrapper bootstrapper_;
    Environment env_;

    Options options_;
    TriggerTable triggers_;
    DiagnosticStore diagnostics_;

    std::map<std::string, std::shared_ptr<Extension>> active_by_name_;
    std::map<std::string, ExtensionRole> roles_;
    std::map<ExtensionRole, std::shared_ptr<Extension>> active_by_role_;
    std::vector<fs::path> runtime_path_;

    std::string client_capability_;
    LanguageClientPlan client_plan_;
    std::vector<std::string> active_servers_;
    std::set<int> attached_buffers_;

    std::map<int, int> cursors_;
    std::vector<Diagnostic> loclist_;
    std::vector<Message> messages_;
    std::optional<StartupReport> last_report_;
    std::optional<LastError> last_error_;
};

} // namespace ks
