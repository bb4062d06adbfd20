// In-process extensions used by the kernel tests.
#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"

namespace ks_test {

// Counters shared by every instance a factory creates, so tests can see
// what happened to instances the kernel owns.
struct Journal {
    int setups = 0;
    std::vector<std::string> invoked;
    YAML::Node last_options;
    std::map<std::string, ks::ServerConfig> servers;
    YAML::Node contributed;
};

class FakeExtension : public ks::Extension {
public:
    FakeExtension(std::string name, std::vector<std::string> actions, std::shared_ptr<Journal> journal)
        : name_(std::move(name)), actions_(std::move(actions)), journal_(std::move(journal)) {}

    std::string name() const override { return name_; }

    void setup(const YAML::Node& options, ks::Host&) override {
        ++journal_->setups;
        journal_->last_options = YAML::Clone(options);
        if (options && options.IsMap() && options["fail"] && options["fail"].as<bool>())
            throw ks::LoaderError(ks::LoaderErrc::SetupFailed, name_ + " refused its options");
        if (options && options.IsMap() && options["throw_raw"] && options["throw_raw"].as<bool>())
            throw 42;
    }

    std::vector<std::string> actions() const override { return actions_; }

    ks::ActionResult invoke(const std::string& action, ks::ActionContext&) override {
        journal_->invoked.push_back(name_ + ":" + action);
        if (action.rfind("decline", 0) == 0) return ks::ActionResult::NotApplicable;
        if (action == "explode") throw std::runtime_error("boom");
        return ks::ActionResult::Handled;
    }

protected:
    std::string name_;
    std::vector<std::string> actions_;
    std::shared_ptr<Journal> journal_;
};

class FakeContributor : public ks::CapabilityContributor {
public:
    explicit FakeContributor(std::shared_ptr<Journal> journal) : journal_(std::move(journal)) {}
    std::string name() const override { return "contributor"; }
    void setup(const YAML::Node&, ks::Host&) override { ++journal_->setups; }
    std::vector<std::string> actions() const override { return {}; }
    ks::ActionResult invoke(const std::string&, ks::ActionContext&) override { return ks::ActionResult::NotApplicable; }
    void contribute(YAML::Node& caps) override {
        caps["textDocument"]["completion"]["completionItem"]["snippetSupport"] = true;
        journal_->contributed = YAML::Clone(caps);
    }

private:
    std::shared_ptr<Journal> journal_;
};

class FakeLanguageClient : public ks::LanguageClient {
public:
    FakeLanguageClient(std::map<std::string, std::vector<std::string>> servers, std::shared_ptr<Journal> journal)
        : known_(std::move(servers)), journal_(std::move(journal)) {}

    std::string name() const override { return "client"; }
    void setup(const YAML::Node&, ks::Host&) override { ++journal_->setups; }
    std::vector<std::string> actions() const override { return {"definition", "hover", "rename"}; }
    ks::ActionResult invoke(const std::string& action, ks::ActionContext& ctx) override {
        journal_->invoked.push_back("client:" + action + "@" + std::to_string(ctx.buffer.value_or(-1)));
        return ks::ActionResult::Handled;
    }

    bool has_server(const std::string& server) const override { return known_.count(server) > 0; }
    void setup_server(const std::string& server, const ks::ServerConfig& config) override {
        if (server == "broken") throw std::runtime_error("server binary missing");
        if (server == "raw") throw 7;
        journal_->servers[server] = config;
    }
    std::vector<std::string> servers_for_filetype(const std::string& filetype) const override {
        std::vector<std::string> out;
        for (const auto& [server, fts] : known_) {
            if (!journal_->servers.count(server)) continue;
            if (std::find(fts.begin(), fts.end(), filetype) != fts.end()) out.push_back(server);
        }
        return out;
    }

private:
    std::map<std::string, std::vector<std::string>> known_;
    std::shared_ptr<Journal> journal_;
};

inline void register_fake(ks::CapabilityRegistry& registry, const std::string& name,
                          std::vector<std::string> actions, std::shared_ptr<Journal> journal) {
    registry.register_capability(name, [name, actions, journal] {
        return std::make_shared<FakeExtension>(name, actions, journal);
    });
}

inline ks::BindingSpec binding(const std::string& modes, const std::string& lhs,
                               std::vector<ks::ActionRef> action, const std::string& desc = "") {
    ks::BindingSpec b;
    b.modes = modes;
    b.lhs = lhs;
    b.action = std::move(action);
    b.desc = desc;
    return b;
}

inline ks::ExtensionDescriptor descriptor(const std::string& capability, std::vector<ks::BindingSpec> bindings,
                                          ks::ExtensionRole role = ks::ExtensionRole::Custom) {
    ks::ExtensionDescriptor d;
    d.role = role;
    d.capability = capability;
    d.bindings = std::move(bindings);
    return d;
}

// A plan with no manager and no settings; tests add what they need.
inline ks::StartupPlan bare_plan(const std::string& name = "test") {
    ks::StartupPlan plan;
    plan.name = name;
    plan.manager.enabled = false;
    plan.language_client.capability_provider.clear();
    return plan;
}

// Kernel that never touches the network or the plugin directories.
inline void isolate(ks::Kernel& kernel) {
    ks::Environment env;
    env.bootstrap = false;
    kernel.set_environment(env);
}

}  // namespace ks_test
