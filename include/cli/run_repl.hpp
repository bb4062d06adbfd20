// FILE: include/cli/run_repl.hpp
#pragma once
#include "cli/session.hpp"
#include "cli_config.hpp"
#include "kernel/interaction.hpp"

void run_repl(ks::InteractionService& svc, CliConfig& config, CliSession& session);
