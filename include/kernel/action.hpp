// Keystrap kernel: tagged actions stored in the trigger table
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ks_types.hpp"

namespace ks {

enum class BuiltinActionId {
    DiagnosticFloat,    // diagnostic.open_float
    DiagnosticLoclist,  // diagnostic.setloclist
    DiagnosticPrev,     // diagnostic.goto_prev
    DiagnosticNext,     // diagnostic.goto_next
    Nop,
};

const char* builtin_action_name(BuiltinActionId id);
std::optional<BuiltinActionId> builtin_action_from_name(const std::string& name);

struct BuiltinAction {
    BuiltinActionId id = BuiltinActionId::Nop;
};

// An action owned by an extension, resolved against its actions() list
// when the binding is registered.
struct ExtensionAction {
    ExtensionRole role = ExtensionRole::Custom;
    std::string capability;
    std::string name;
};

// Steps are tried in order until one reports Handled; when none does the
// key falls back to its literal meaning.
struct ActionChain {
    std::vector<ExtensionAction> steps;
};

using Action = std::variant<BuiltinAction, ExtensionAction, ActionChain>;

bool operator==(const BuiltinAction& a, const BuiltinAction& b);
bool operator==(const ExtensionAction& a, const ExtensionAction& b);
bool operator==(const ActionChain& a, const ActionChain& b);

std::string describe_action(const Action& action);
// True when any part of `action` is owned by `capability`.
bool action_references(const Action& action, const std::string& capability);

} // namespace ks
