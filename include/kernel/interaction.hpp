// Keystrap kernel: Interaction API between CLI and Kernel
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"
#include "kernel/load_result.hpp"
#include "kernel/presets.hpp"
#include "kernel/services/plan_io_service.hpp"

namespace ks {

// Minimal interaction facade to decouple frontends from Kernel internals.
class InteractionService {
public:
    explicit InteractionService(Kernel& kernel) : kernel_(kernel) {}

    // Plans
    std::optional<StartupPlan> cmd_preset(const std::string& name) const { return preset_by_name(name); }
    std::optional<StartupPlan> cmd_load_manifest(const std::string& path) {
        error_.reset();
        try {
            return io_.load(path);
        } catch (const LoaderError& e) {
            error_ = Kernel::LastError{e.code(), e.what()};
            return std::nullopt;
        }
    }
    bool cmd_save_manifest(const StartupPlan& plan, const std::string& path) {
        error_.reset();
        try {
            io_.save(plan, path);
            return true;
        } catch (const LoaderError& e) {
            error_ = Kernel::LastError{e.code(), e.what()};
            return false;
        }
    }

    // Startup. Returns nullopt when bootstrap failed; see cmd_last_error().
    std::optional<StartupReport> cmd_startup(const StartupPlan& plan) {
        error_.reset();
        try {
            return kernel_.run_startup(plan);
        } catch (const LoaderError& e) {
            error_ = kernel_.last_error();
            if (!error_) error_ = Kernel::LastError{e.code(), e.what()};
            return std::nullopt;
        }
    }
    const std::optional<StartupReport>& cmd_last_report() const { return kernel_.last_report(); }
    // Most recent failure of any cmd_* call; cleared when the next one starts.
    const std::optional<Kernel::LastError>& cmd_last_error() const { return error_; }
    void cmd_set_environment(Environment env) { kernel_.set_environment(std::move(env)); }
    const Environment& cmd_environment() const { return kernel_.environment(); }

    // Extensions
    ExtensionLoadResult cmd_extensions_load_report(const std::vector<std::string>& dirs) {
        auto r = kernel_.extensions().load_from_dirs_report(dirs);
        kernel_.extensions().seed_builtins_from_registry();
        return r;
    }
    int cmd_extensions_unload(const std::string& library_path) { return kernel_.extensions().unload_by_source(library_path); }
    int cmd_extensions_unload_all() { return kernel_.extensions().unload_all_extensions(); }
    std::map<std::string, std::string> cmd_capability_sources() const { return kernel_.extensions().capability_sources(); }
    std::vector<std::string> cmd_capabilities() const { return kernel_.registry().get_keys(); }
    std::vector<std::string> cmd_active_servers() const { return kernel_.active_servers(); }
    std::vector<fs::path> cmd_runtime_path() const { return kernel_.runtime_path(); }

    // Options
    bool cmd_set_option(const std::string& name, const std::string& value) {
        error_.reset();
        try {
            kernel_.mutable_options().parse_and_set(name, value);
            return true;
        } catch (const LoaderError& e) {
            error_ = Kernel::LastError{e.code(), e.what()};
            return false;
        }
    }
    std::optional<SettingValue> cmd_get_option(const std::string& name) const {
        if (!Options::find_spec(name)) return std::nullopt;
        return kernel_.options().get(name);
    }
    std::optional<SettingValue> cmd_get_local_option(int buffer, const std::string& name) const {
        return kernel_.options().get_local(buffer, name);
    }
    const Options& cmd_options() const { return kernel_.options(); }

    // Triggers
    std::vector<Binding> cmd_bindings() const { return kernel_.triggers().entries(); }
    DispatchResult cmd_feed(Mode mode, const std::string& keys, std::optional<int> buffer = std::nullopt) {
        return kernel_.feed(mode, keys, buffer);
    }
    std::vector<std::string> cmd_attach(int buffer, const std::string& filetype) { return kernel_.attach_buffer(buffer, filetype); }

    // Diagnostics
    void cmd_add_diagnostic(int buffer, Diagnostic d) { kernel_.diagnostics().add(buffer, std::move(d)); }
    void cmd_clear_diagnostics(int buffer) { kernel_.diagnostics().clear(buffer); }
    std::vector<Diagnostic> cmd_diagnostics(int buffer) const { return kernel_.diagnostics().list(buffer); }
    const DiagnosticsConfig& cmd_diagnostics_config() const { return kernel_.diagnostics().config(); }
    std::string cmd_virtual_text(const Diagnostic& d) const { return kernel_.diagnostics().virtual_text(d); }
    const std::vector<Diagnostic>& cmd_location_list() const { return kernel_.location_list(); }
    void cmd_set_cursor(int buffer, int line) { kernel_.set_cursor(buffer, line); }
    int cmd_cursor(int buffer) const { return kernel_.cursor(buffer); }

    // Messages
    std::vector<Kernel::Message> cmd_drain_messages() {
        auto out = kernel_.messages();
        kernel_.clear_messages();
        return out;
    }

private:
    Kernel& kernel_;
    PlanIOService io_;
    std::optional<Kernel::LastError> error_;
};

} // namespace ks
