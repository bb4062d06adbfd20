#include "kernel/action.hpp"

namespace ks {

const char* builtin_action_name(BuiltinActionId id) {
    switch (id) {
        case BuiltinActionId::DiagnosticFloat: return "diagnostic.open_float";
        case BuiltinActionId::DiagnosticLoclist: return "diagnostic.setloclist";
        case BuiltinActionId::DiagnosticPrev: return "diagnostic.goto_prev";
        case BuiltinActionId::DiagnosticNext: return "diagnostic.goto_next";
        case BuiltinActionId::Nop: return "nop";
    }
    return "nop";
}

std::optional<BuiltinActionId> builtin_action_from_name(const std::string& name) {
    for (auto id : {BuiltinActionId::DiagnosticFloat, BuiltinActionId::DiagnosticLoclist,
                    BuiltinActionId::DiagnosticPrev, BuiltinActionId::DiagnosticNext,
                    BuiltinActionId::Nop}) {
        if (name == builtin_action_name(id)) return id;
    }
    return std::nullopt;
}

bool operator==(const BuiltinAction& a, const BuiltinAction& b) { return a.id == b.id; }

bool operator==(const ExtensionAction& a, const ExtensionAction& b) {
    return a.role == b.role && a.capability == b.capability && a.name == b.name;
}

bool operator==(const ActionChain& a, const ActionChain& b) { return a.steps == b.steps; }

std::string describe_action(const Action& action) {
    if (auto b = std::get_if<BuiltinAction>(&action)) {
        return std::string("builtin:") + builtin_action_name(b->id);
    }
    if (auto e = std::get_if<ExtensionAction>(&action)) {
        return e->capability + ":" + e->name;
    }
    std::string out;
    for (const auto& step : std::get<ActionChain>(action).steps) {
        if (!out.empty()) out += " > ";
        out += step.capability + ":" + step.name;
    }
    return out;
}

bool action_references(const Action& action, const std::string& capability) {
    if (auto e = std::get_if<ExtensionAction>(&action)) return e->capability == capability;
    if (auto c = std::get_if<ActionChain>(&action)) {
        for (const auto& step : c->steps)
            if (step.capability == capability) return true;
    }
    return false;
}

} // namespace ks
