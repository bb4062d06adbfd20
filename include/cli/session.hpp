// Front-end state shared by the one-shot CLI and the REPL
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "kernel/interaction.hpp"

struct CliSession {
    ks::StartupPlan plan;
    // Every kernel message seen so far, debug included.
    std::vector<ks::Kernel::Message> log;
    bool bootstrap = true;
};

// Plan from `manifest` when non-empty, else from `preset`. Prints an error
// and returns nullopt when neither resolves.
std::optional<ks::StartupPlan> resolve_plan(ks::InteractionService& svc, const std::string& manifest,
                                            const std::string& preset);

// Applies CliConfig::settings on top of the plan. Values are parsed with
// the option schema; malformed values are reported and skipped.
void apply_config_settings(ks::StartupPlan& plan, const CliConfig& config);

ks::Environment make_environment(const CliConfig& config, bool bootstrap);

// Runs startup for session.plan and prints a one-line summary plus any
// warnings. Returns false when the manager bootstrap failed.
bool run_session_startup(ks::InteractionService& svc, CliSession& session, const CliConfig& config);

// Drains kernel messages into session.log and prints those at `min_level`
// or above.
void flush_messages(ks::InteractionService& svc, CliSession& session,
                    ks::MessageLevel min_level = ks::MessageLevel::Info);

// Capability -> library path as `keys_source_mode` asks for it. Built-in
// capabilities are left out.
std::map<std::string, std::string> owner_display_paths(ks::InteractionService& svc, const CliConfig& config);
