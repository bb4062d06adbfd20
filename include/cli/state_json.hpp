// JSON dump of the loader state
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "kernel/interaction.hpp"

nlohmann::json state_to_json(const ks::InteractionService& svc);
// Returns false when the file cannot be written.
bool write_state_json(const ks::InteractionService& svc, const std::string& path);
