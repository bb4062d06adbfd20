// Keystrap kernel: Kernel implementation
#include "kernel/kernel.hpp"

#include <algorithm>

#include "kernel/keys.hpp"

namespace ks {

int StartupReport::active_count() const {
    return static_cast<int>(std::count_if(extensions.begin(), extensions.end(), [](const ExtensionRecord& r) {
        return r.state == ExtensionState::Active;
    }));
}

const ExtensionRecord* StartupReport::find(const std::string& capability) const {
    for (const auto& r : extensions)
        if (r.capability == capability) return &r;
    return nullptr;
}

const char* dispatch_status_name(DispatchStatus s) {
    switch (s) {
        case DispatchStatus::Unmapped: return "unmapped";
        case DispatchStatus::Handled: return "handled";
        case DispatchStatus::Fallback: return "fallback";
        case DispatchStatus::Failed: return "failed";
    }
    return "unmapped";
}

Kernel::Kernel(Bootstrapper::Fetcher fetcher) : bootstrapper_(std::move(fetcher)) {}

Kernel::~Kernel() = default;

void Kernel::reset() {
    options_.reset();
    triggers_.clear();
    diagnostics_.configure(DiagnosticsConfig{});
    diagnostics_.clear_all();
    active_by_role_.clear();
    active_by_name_.clear();
    roles_.clear();
    runtime_path_.clear();
    client_capability_.clear();
    client_plan_ = LanguageClientPlan{};
    active_servers_.clear();
    attached_buffers_.clear();
    cursors_.clear();
    loclist_.clear();
    messages_.clear();
    last_error_.reset();
}

void Kernel::message(MessageLevel level, const std::string& text) {
    messages_.push_back({level, text});
}

bool Kernel::capability_active(const std::string& capability) const {
    return active_by_name_.count(capability) > 0;
}

std::shared_ptr<Extension> Kernel::active(ExtensionRole role) const {
    auto it = active_by_role_.find(role);
    return it == active_by_role_.end() ? nullptr : it->second;
}

std::shared_ptr<Extension> Kernel::active(const std::string& capability) const {
    auto it = active_by_name_.find(capability);
    return it == active_by_name_.end() ? nullptr : it->second;
}

int Kernel::cursor(int buffer) const {
    auto it = cursors_.find(buffer);
    return it == cursors_.end() ? 1 : it->second;
}

StartupReport Kernel::run_startup(const StartupPlan& plan) {
    reset();
    StartupReport report;
    report.plan = plan.name;

    apply_settings(plan, report);

    if (env_.bootstrap && plan.manager.enabled) {
        try {
            auto outcome = bootstrapper_.ensure(env_.data_dir, plan.manager, env_.fetch_command);
            runtime_path_.insert(runtime_path_.begin(), outcome.path);
            if (outcome.fetched) message(MessageLevel::Info, "Installed " + plan.manager.name + " into " + outcome.path.string());
            report.bootstrap = std::move(outcome);
        } catch (const LoaderError& e) {
            // Nothing downstream can register without the manager.
            last_error_ = LastError{e.code(), e.what()};
            message(MessageLevel::Error, e.what());
            last_report_ = report;
            throw;
        }
    }

    report.load = manager_.load_from_dirs_report(extension_dirs_for(plan));
    for (const auto& err : report.load.errors)
        message(MessageLevel::Warning, "Extension library '" + err.path + "': " + err.message);
    manager_.seed_builtins_from_registry();

    for (const auto& desc : plan.extensions) process_descriptor(desc, plan, report);

    register_bindings(plan.bindings, kBuiltinOwner, std::nullopt, &report);

    last_report_ = report;
    return report;
}

void Kernel::apply_settings(const StartupPlan& plan, StartupReport& report) {
    for (const auto& [name, value] : plan.settings) {
        try {
            options_.set(name, value);
        } catch (const LoaderError& e) {
            report.rejected_settings.emplace_back(name, e.what());
            message(MessageLevel::Warning, e.what());
        }
    }
}

std::vector<std::string> Kernel::extension_dirs_for(const StartupPlan& plan) const {
    std::vector<std::string> dirs = env_.extension_dirs;
    if (!plan.manager.enabled) return dirs;
    std::set<std::string> seen;
    auto add = [&](const std::string& repo) {
        auto dir = PluginSpec::dir_name(repo);
        if (dir.empty() || !seen.insert(dir).second) return;
        dirs.push_back((env_.data_dir / "lazy" / dir).string() + "/**");
    };
    for (const auto& p : plan.plugins) {
        for (const auto& dep : p.dependencies) add(dep);
        add(p.repo);
    }
    return dirs;
}

void Kernel::process_descriptor(const ExtensionDescriptor& desc, const StartupPlan& plan,
                                StartupReport& report) {
    ExtensionRecord rec;
    rec.role = desc.role;
    rec.capability = desc.capability;
    rec.source = manager_.source_of(desc.capability);
    if (report.find(desc.capability)) {
        // Left in Declared state; the first declaration stays in effect.
        rec.reason = "already declared";
        message(MessageLevel::Warning, "Skipping " + desc.capability + ": " + rec.reason);
        report.extensions.push_back(rec);
        return;
    }
    rec.state = ExtensionState::Probing;

    YAML::Node capabilities;
    if (desc.role == ExtensionRole::LanguageClient)
        capabilities = negotiate_capabilities(plan.language_client, report);

    std::string reason;
    auto ext = registry_.probe(desc.capability, &reason);
    if (ext && desc.role == ExtensionRole::LanguageClient && !std::dynamic_pointer_cast<LanguageClient>(ext)) {
        ext.reset();
        reason = "does not implement the language client interface";
    }
    if (ext) {
        try {
            ext->setup(YAML::Clone(desc.options), *this);
        } catch (const std::exception& e) {
            ext.reset();
            reason = std::string("setup failed: ") + e.what();
        } catch (...) {
            ext.reset();
            reason = "setup failed: unknown exception";
        }
    }

    if (!ext) {
        rec.state = ExtensionState::Inactive;
        rec.reason = reason;
        message(MessageLevel::Debug, "Skipping " + desc.capability + ": " + reason);
        report.extensions.push_back(rec);
        return;
    }

    rec.state = ExtensionState::Active;
    active_by_name_[desc.capability] = ext;
    active_by_role_[desc.role] = ext;
    roles_[desc.capability] = desc.role;

    rec.bindings = register_bindings(desc.bindings, desc.capability, std::nullopt, &report);

    if (desc.role == ExtensionRole::LanguageClient) {
        auto client = std::dynamic_pointer_cast<LanguageClient>(ext);
        configure_language_client(*client, desc.capability, plan.language_client, capabilities, report);
    }
    report.extensions.push_back(rec);
}

YAML::Node Kernel::negotiate_capabilities(const LanguageClientPlan& plan, StartupReport& report) {
    YAML::Node capabilities = make_client_capabilities();
    if (plan.capability_provider.empty()) return capabilities;

    std::string reason;
    auto contributor = std::dynamic_pointer_cast<CapabilityContributor>(
        registry_.probe(plan.capability_provider, &reason));
    if (!contributor) {
        if (reason.empty()) reason = "not a capability contributor";
        message(MessageLevel::Debug, "Using default client capabilities (" + plan.capability_provider + ": " + reason + ")");
        return capabilities;
    }
    YAML::Node enriched = YAML::Clone(capabilities);
    try {
        contributor->contribute(enriched);
    } catch (const std::exception& e) {
        message(MessageLevel::Debug, "Using default client capabilities (" + plan.capability_provider + ": " + e.what() + ")");
        return capabilities;
    } catch (...) {
        message(MessageLevel::Debug, "Using default client capabilities (" + plan.capability_provider + ": unknown exception)");
        return capabilities;
    }
    report.capabilities_contributed = true;
    return enriched;
}

void Kernel::configure_language_client(LanguageClient& client, const std::string& capability,
                                       const LanguageClientPlan& plan, const YAML::Node& capabilities,
                                       StartupReport& report) {
    diagnostics_.configure(plan.diagnostics);
    client_capability_ = capability;
    client_plan_ = plan;

    ServerConfig shared;
    shared.debounce_text_changes_ms = plan.debounce_text_changes_ms;
    shared.capabilities = capabilities;

    for (const auto& server : plan.servers) {
        ServerRecord rec;
        rec.name = server;
        if (!client.has_server(server)) {
            rec.reason = "no configuration for server";
        } else {
            try {
                client.setup_server(server, shared);
                rec.active = true;
                active_servers_.push_back(server);
            } catch (const std::exception& e) {
                rec.reason = e.what();
            } catch (...) {
                rec.reason = "unknown exception";
            }
        }
        if (!rec.active) message(MessageLevel::Debug, "Skipping server " + server + ": " + rec.reason);
        report.servers.push_back(rec);
    }
}

std::optional<Action> Kernel::resolve_action(const BindingSpec& spec, const std::string& default_owner,
                                             std::string& reason) {
    if (spec.action.empty()) {
        reason = "no action";
        return std::nullopt;
    }
    auto owner_of = [&](const ActionRef& ref) { return ref.owner.empty() ? default_owner : ref.owner; };

    const ActionRef& primary = spec.action.front();
    const std::string primary_owner = owner_of(primary);
    if (primary_owner == kBuiltinOwner) {
        auto id = builtin_action_from_name(primary.name);
        if (!id) {
            reason = "unknown builtin action '" + primary.name + "'";
            return std::nullopt;
        }
        if (spec.action.size() > 1) {
            reason = "builtin actions cannot start a chain";
            return std::nullopt;
        }
        return Action{BuiltinAction{*id}};
    }

    auto has_action = [](const Extension& ext, const std::string& name) {
        auto names = ext.actions();
        return std::find(names.begin(), names.end(), name) != names.end();
    };

    auto primary_ext = active(primary_owner);
    if (!primary_ext) {
        reason = "'" + primary_owner + "' is not active";
        return std::nullopt;
    }
    if (!has_action(*primary_ext, primary.name)) {
        reason = "'" + primary_owner + "' has no action '" + primary.name + "'";
        return std::nullopt;
    }

    std::vector<ExtensionAction> steps;
    steps.push_back({roles_.at(primary_owner), primary_owner, primary.name});
    for (size_t i = 1; i < spec.action.size(); ++i) {
        const auto& ref = spec.action[i];
        const auto owner = owner_of(ref);
        auto ext = active(owner);
        if (owner == kBuiltinOwner || !ext) continue;  // optional step, owner absent
        if (!has_action(*ext, ref.name)) {
            message(MessageLevel::Warning, "Dropping chain step " + owner + ":" + ref.name + " (unknown action)");
            continue;
        }
        steps.push_back({roles_.at(owner), owner, ref.name});
    }
    if (steps.size() == 1) return Action{steps.front()};
    return Action{ActionChain{std::move(steps)}};
}

int Kernel::register_bindings(const std::vector<BindingSpec>& specs, const std::string& default_owner,
                              std::optional<int> buffer, StartupReport* report) {
    int registered = 0;
    const std::string leader = options_.get_string("mapleader");
    for (const auto& spec : specs) {
        std::string reason;
        std::optional<Action> action;
        auto modes = parse_mode_set(spec.modes);
        if (!modes) reason = "invalid mode set '" + spec.modes + "'";
        else if (spec.lhs.empty()) reason = "empty trigger";
        else action = resolve_action(spec, default_owner, reason);

        if (!action) {
            const std::string owner = spec.action.empty() || spec.action.front().owner.empty()
                                          ? default_owner
                                          : spec.action.front().owner;
            if (report) report->skipped_bindings.push_back({owner, spec.modes, spec.lhs, reason});
            // Bindings of absent extensions are expected; anything else is a plan mistake.
            const bool expected = owner != kBuiltinOwner && !capability_active(owner);
            message(expected ? MessageLevel::Debug : MessageLevel::Warning,
                    "Skipping binding " + spec.modes + " " + spec.lhs + ": " + reason);
            continue;
        }

        const std::string lhs = normalize_keys(spec.lhs, leader);
        std::string owner = kBuiltinOwner;
        if (auto e = std::get_if<ExtensionAction>(&*action)) owner = e->capability;
        else if (auto c = std::get_if<ActionChain>(&*action)) owner = c->steps.front().capability;
        for (auto mode : *modes) {
            Binding b;
            b.key = TriggerKey{buffer, mode, lhs};
            b.action = *action;
            b.desc = spec.desc;
            b.silent = spec.silent;
            b.owner = owner;
            triggers_.set(std::move(b));
        }
        ++registered;
    }
    return registered;
}

DispatchResult Kernel::feed(Mode mode, const std::string& keys, std::optional<int> buffer) {
    DispatchResult result;
    result.lhs = normalize_keys(keys, options_.get_string("mapleader"));
    const Binding* binding = triggers_.find(mode, result.lhs, buffer);
    if (!binding) return result;

    const Action action = binding->action;
    result.action = describe_action(action);
    ActionContext ctx{*this, mode, result.lhs, buffer, buffer ? cursor(*buffer) : 1};
    try {
        ActionResult outcome = ActionResult::NotApplicable;
        if (auto b = std::get_if<BuiltinAction>(&action)) {
            outcome = run_builtin(b->id, ctx);
        } else if (auto e = std::get_if<ExtensionAction>(&action)) {
            outcome = run_step(*e, ctx);
        } else {
            for (const auto& step : std::get<ActionChain>(action).steps) {
                outcome = run_step(step, ctx);
                if (outcome == ActionResult::Handled) break;
            }
        }
        result.status = outcome == ActionResult::Handled ? DispatchStatus::Handled : DispatchStatus::Fallback;
    } catch (const std::exception& e) {
        result.status = DispatchStatus::Failed;
        result.detail = e.what();
        message(MessageLevel::Error, result.action + ": " + e.what());
    }
    return result;
}

ActionResult Kernel::run_step(const ExtensionAction& step, ActionContext& ctx) {
    auto ext = active(step.capability);
    if (!ext) throw LoaderError(LoaderErrc::MissingCapability, "'" + step.capability + "' is not active");
    return ext->invoke(step.name, ctx);
}

ActionResult Kernel::run_builtin(BuiltinActionId id, ActionContext& ctx) {
    const int buffer = ctx.buffer.value_or(0);
    switch (id) {
        case BuiltinActionId::DiagnosticFloat: {
            auto items = diagnostics_.at_line(buffer, ctx.line);
            if (items.empty()) message(MessageLevel::Info, "No diagnostics on line " + std::to_string(ctx.line));
            for (const auto& d : items) message(MessageLevel::Info, diagnostics_.float_text(d));
            return ActionResult::Handled;
        }
        case BuiltinActionId::DiagnosticLoclist:
            loclist_ = diagnostics_.list(buffer);
            message(MessageLevel::Info, "Location list: " + std::to_string(loclist_.size()) + " item(s)");
            return ActionResult::Handled;
        case BuiltinActionId::DiagnosticPrev:
        case BuiltinActionId::DiagnosticNext: {
            auto d = id == BuiltinActionId::DiagnosticNext ? diagnostics_.next_after(buffer, ctx.line)
                                                          : diagnostics_.prev_before(buffer, ctx.line);
            if (!d) {
                message(MessageLevel::Info, "No more diagnostics");
                return ActionResult::Handled;
            }
            cursors_[buffer] = d->line;
            message(MessageLevel::Info, diagnostics_.float_text(*d));
            return ActionResult::Handled;
        }
        case BuiltinActionId::Nop:
            return ActionResult::Handled;
    }
    return ActionResult::NotApplicable;
}

std::vector<std::string> Kernel::attach_buffer(int buffer, const std::string& filetype) {
    auto client = std::dynamic_pointer_cast<LanguageClient>(active(client_capability_));
    if (!client) return {};

    std::vector<std::string> attached;
    for (const auto& server : client->servers_for_filetype(filetype)) {
        if (std::find(active_servers_.begin(), active_servers_.end(), server) != active_servers_.end())
            attached.push_back(server);
    }
    if (attached.empty()) return attached;

    if (attached_buffers_.insert(buffer).second) {
        register_bindings(client_plan_.attach_bindings, client_capability_, buffer, nullptr);
        options_.set_local(buffer, "omnifunc", std::string("lsp"));
    }
    return attached;
}

} // namespace ks
