// Keystrap kernel: built-in startup presets
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kernel/startup_plan.hpp"

namespace ks {

// "lean": fuzzy finder, syntax tree, language client, completion and
// snippets, colours taken from the terminal palette. "truecolor": lean with
// 24-bit colour and the client's server configurations installed as a plugin.
StartupPlan make_lean_preset();
StartupPlan make_truecolor_preset();

std::optional<StartupPlan> preset_by_name(const std::string& name);
std::vector<std::string> preset_names();

} // namespace ks
