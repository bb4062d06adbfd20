// Keystrap kernel: trigger table (keymap)
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/action.hpp"

namespace ks {

struct TriggerKey {
    std::optional<int> buffer;  // nullopt = global
    Mode mode = Mode::Normal;
    std::string lhs;            // normalised key sequence

    bool operator<(const TriggerKey& o) const;
    bool operator==(const TriggerKey& o) const;
};

struct Binding {
    TriggerKey key;
    Action action;
    std::string desc;
    bool silent = false;
    std::string owner;  // capability name or "builtin"
};

// One entry per (scope, mode, lhs). set() overwrites: last registration wins.
class KEYSTRAP_API TriggerTable {
public:
    // Returns true when an existing entry was replaced.
    bool set(Binding binding);
    bool erase(const TriggerKey& key);
    void clear() { table_.clear(); }

    // Buffer-local entries shadow global ones.
    const Binding* find(Mode mode, const std::string& lhs,
                        std::optional<int> buffer = std::nullopt) const;
    const Binding* find_exact(const TriggerKey& key) const;

    // Sorted by scope (global first), mode, lhs.
    std::vector<Binding> entries() const;
    std::vector<Binding> entries_for_owner(const std::string& owner) const;
    bool references(const std::string& capability) const;

    size_t size() const { return table_.size(); }
    bool empty() const { return table_.empty(); }

private:
    std::map<TriggerKey, Binding> table_;
};

} // namespace ks
