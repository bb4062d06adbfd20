// Terminal tables for the REPL and one-shot printing
#pragma once

#include <map>
#include <string>
#include <vector>

#include "kernel/interaction.hpp"

// `sources` maps owner capability -> library path; when non-null the
// owner column shows the path instead of the name.
std::string render_key_table(const std::vector<ks::Binding>& bindings,
                             const std::map<std::string, std::string>* sources = nullptr);
std::string render_extension_table(const ks::StartupReport& report);
std::string render_server_table(const ks::StartupReport& report);
std::string render_diagnostic_table(const std::vector<ks::Diagnostic>& items,
                                    const ks::InteractionService& svc);
