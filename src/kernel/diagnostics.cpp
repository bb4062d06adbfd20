// Keystrap kernel: DiagnosticStore implementation
#include "kernel/diagnostics.hpp"

#include <algorithm>
#include <tuple>

namespace ks {

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
        case Severity::Hint: return "hint";
    }
    return "error";
}

std::optional<Severity> severity_from_name(const std::string& name) {
    if (name == "error" || name == "e") return Severity::Error;
    if (name == "warning" || name == "warn" || name == "w") return Severity::Warning;
    if (name == "info" || name == "i") return Severity::Info;
    if (name == "hint" || name == "h") return Severity::Hint;
    return std::nullopt;
}

bool DiagnosticsConfig::operator==(const DiagnosticsConfig& o) const {
    return virtual_text == o.virtual_text && virtual_text_spacing == o.virtual_text_spacing &&
           virtual_text_prefix == o.virtual_text_prefix && signs == o.signs &&
           update_in_insert == o.update_in_insert && severity_sort == o.severity_sort;
}

void DiagnosticStore::add(int buffer, Diagnostic d) { items_[buffer].push_back(std::move(d)); }

void DiagnosticStore::set(int buffer, std::vector<Diagnostic> items) {
    items_[buffer] = std::move(items);
}

void DiagnosticStore::clear(int buffer) { items_.erase(buffer); }

std::vector<Diagnostic> DiagnosticStore::at_line(int buffer, int line) const {
    std::vector<Diagnostic> out;
    auto it = items_.find(buffer);
    if (it == items_.end()) return out;
    for (const auto& d : it->second)
        if (d.line == line) out.push_back(d);
    if (config_.severity_sort) {
        std::stable_sort(out.begin(), out.end(), [](const Diagnostic& a, const Diagnostic& b) {
            return static_cast<int>(a.severity) < static_cast<int>(b.severity);
        });
    }
    return out;
}

std::vector<Diagnostic> DiagnosticStore::list(int buffer) const {
    std::vector<Diagnostic> out;
    auto it = items_.find(buffer);
    if (it == items_.end()) return out;
    out = it->second;
    std::stable_sort(out.begin(), out.end(), [](const Diagnostic& a, const Diagnostic& b) {
        return std::make_tuple(a.line, a.col, static_cast<int>(a.severity)) <
               std::make_tuple(b.line, b.col, static_cast<int>(b.severity));
    });
    return out;
}

std::optional<Diagnostic> DiagnosticStore::next_after(int buffer, int line) const {
    for (const auto& d : list(buffer))
        if (d.line > line) return d;
    return std::nullopt;
}

std::optional<Diagnostic> DiagnosticStore::prev_before(int buffer, int line) const {
    auto all = list(buffer);
    for (auto it = all.rbegin(); it != all.rend(); ++it)
        if (it->line < line) return *it;
    return std::nullopt;
}

std::string DiagnosticStore::virtual_text(const Diagnostic& d) const {
    if (!config_.virtual_text) return "";
    return config_.virtual_text_prefix + std::string(std::max(config_.virtual_text_spacing, 0), ' ') +
           d.message;
}

std::string DiagnosticStore::float_text(const Diagnostic& d) const {
    std::string out = std::to_string(d.line) + ":" + std::to_string(d.col) + " " +
                      severity_name(d.severity) + ": " + d.message;
    if (!d.source.empty()) out += " [" + d.source + "]";
    return out;
}

} // namespace ks
