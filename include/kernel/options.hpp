// Keystrap kernel: editor option store
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ks_types.hpp"

namespace ks {

// Process-wide editor options with a fixed schema. Global options live in
// one table; buffer-local options (only "omnifunc" today) per buffer id.
class KEYSTRAP_API Options {
public:
    enum class Scope { Global, Buffer };
    struct Spec {
        std::string name;
        SettingValue default_value;
        Scope scope = Scope::Global;
    };

    Options();

    static const std::vector<Spec>& schema();
    static const Spec* find_spec(const std::string& name);

    // Converts CLI/YAML text to the value type the schema declares for `name`.
    // Throws LoaderError(InvalidSetting) on unknown names or malformed text.
    static SettingValue parse_value(const std::string& name, const std::string& text);

    // Throws LoaderError(InvalidSetting) on unknown name, type mismatch or
    // a negative timing value.
    void set(const std::string& name, const SettingValue& value);
    void parse_and_set(const std::string& name, const std::string& text);
    SettingValue get(const std::string& name) const;

    bool get_bool(const std::string& name) const;
    int get_int(const std::string& name) const;
    std::string get_string(const std::string& name) const;

    void set_local(int buffer, const std::string& name, const SettingValue& value);
    std::optional<SettingValue> get_local(int buffer, const std::string& name) const;

    // Names of options that differ from their defaults, in schema order.
    std::vector<std::string> changed() const;
    const std::map<std::string, SettingValue>& values() const { return values_; }

    void reset();

private:
    static void check(const Spec& spec, const SettingValue& value);

    std::map<std::string, SettingValue> values_;
    std::map<int, std::map<std::string, SettingValue>> local_;
};

} // namespace ks
