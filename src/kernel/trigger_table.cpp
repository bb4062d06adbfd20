// Keystrap kernel: TriggerTable implementation
#include "kernel/trigger_table.hpp"

#include <tuple>

namespace ks {

bool TriggerKey::operator<(const TriggerKey& o) const {
    return std::tie(buffer, mode, lhs) < std::tie(o.buffer, o.mode, o.lhs);
}

bool TriggerKey::operator==(const TriggerKey& o) const {
    return buffer == o.buffer && mode == o.mode && lhs == o.lhs;
}

bool TriggerTable::set(Binding binding) {
    auto key = binding.key;
    auto [it, inserted] = table_.insert_or_assign(std::move(key), std::move(binding));
    (void)it;
    return !inserted;
}

bool TriggerTable::erase(const TriggerKey& key) { return table_.erase(key) > 0; }

const Binding* TriggerTable::find(Mode mode, const std::string& lhs,
                                  std::optional<int> buffer) const {
    if (buffer) {
        if (auto* local = find_exact(TriggerKey{buffer, mode, lhs})) return local;
    }
    return find_exact(TriggerKey{std::nullopt, mode, lhs});
}

const Binding* TriggerTable::find_exact(const TriggerKey& key) const {
    auto it = table_.find(key);
    return it == table_.end() ? nullptr : &it->second;
}

std::vector<Binding> TriggerTable::entries() const {
    std::vector<Binding> out;
    out.reserve(table_.size());
    for (const auto& [key, b] : table_) out.push_back(b);
    return out;
}

std::vector<Binding> TriggerTable::entries_for_owner(const std::string& owner) const {
    std::vector<Binding> out;
    for (const auto& [key, b] : table_)
        if (b.owner == owner) out.push_back(b);
    return out;
}

bool TriggerTable::references(const std::string& capability) const {
    for (const auto& [key, b] : table_)
        if (b.owner == capability || action_references(b.action, capability)) return true;
    return false;
}

} // namespace ks
