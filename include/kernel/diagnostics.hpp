// Keystrap kernel: diagnostics presentation and storage
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ks_types.hpp"

namespace ks {

enum class Severity { Error = 1, Warning, Info, Hint };

const char* severity_name(Severity s);
std::optional<Severity> severity_from_name(const std::string& name);

struct Diagnostic {
    int line = 0;
    int col = 0;
    Severity severity = Severity::Error;
    std::string message;
    std::string source;
};

// Presentation settings only; diagnostics are produced elsewhere.
struct DiagnosticsConfig {
    bool virtual_text = true;
    int virtual_text_spacing = 4;
    std::string virtual_text_prefix = "\xE2\x96\xA0";  // U+25A0
    bool signs = true;
    bool update_in_insert = false;
    bool severity_sort = false;

    bool operator==(const DiagnosticsConfig& o) const;
};

class KEYSTRAP_API DiagnosticStore {
public:
    void configure(const DiagnosticsConfig& config) { config_ = config; }
    const DiagnosticsConfig& config() const { return config_; }

    void add(int buffer, Diagnostic d);
    void set(int buffer, std::vector<Diagnostic> items);
    void clear(int buffer);
    void clear_all() { items_.clear(); }

    // Items on `line`, most severe first when severity_sort is on,
    // otherwise in insertion order.
    std::vector<Diagnostic> at_line(int buffer, int line) const;
    // Every item of the buffer ordered by line, column, then severity.
    std::vector<Diagnostic> list(int buffer) const;
    std::optional<Diagnostic> next_after(int buffer, int line) const;
    std::optional<Diagnostic> prev_before(int buffer, int line) const;

    // Inline text for one item, or "" when virtual text is off.
    std::string virtual_text(const Diagnostic& d) const;
    std::string float_text(const Diagnostic& d) const;

private:
    DiagnosticsConfig config_;
    std::map<int, std::vector<Diagnostic>> items_;
};

} // namespace ks
