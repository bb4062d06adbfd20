// Keystrap kernel: Options implementation
#include "kernel/options.hpp"

#include <algorithm>
#include <cctype>

namespace ks {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* type_name(const SettingValue& v) {
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<int>(v)) return "integer";
    return "string";
}

}  // namespace

Options::Options() { reset(); }

const std::vector<Options::Spec>& Options::schema() {
    static const std::vector<Spec> specs = {
        {"mapleader", std::string("\\"), Scope::Global},
        {"number", false, Scope::Global},
        {"relativenumber", false, Scope::Global},
        {"signcolumn", std::string("auto"), Scope::Global},
        {"ignorecase", false, Scope::Global},
        {"smartcase", false, Scope::Global},
        {"updatetime", 4000, Scope::Global},
        {"timeoutlen", 1000, Scope::Global},
        {"termguicolors", false, Scope::Global},
        {"colorscheme", std::string("default"), Scope::Global},
        {"omnifunc", std::string(""), Scope::Buffer},
    };
    return specs;
}

const Options::Spec* Options::find_spec(const std::string& name) {
    for (const auto& s : schema())
        if (s.name == name) return &s;
    return nullptr;
}

SettingValue Options::parse_value(const std::string& name, const std::string& text) {
    const Spec* spec = find_spec(name);
    if (!spec) throw LoaderError(LoaderErrc::InvalidSetting, "Unknown option: " + name);

    if (std::holds_alternative<bool>(spec->default_value)) {
        auto t = lower(text);
        if (t == "true" || t == "yes" || t == "on" || t == "1") return true;
        if (t == "false" || t == "no" || t == "off" || t == "0") return false;
        throw LoaderError(LoaderErrc::InvalidSetting,
                          "Option '" + name + "' expects a boolean, got '" + text + "'");
    }
    if (std::holds_alternative<int>(spec->default_value)) {
        try {
            size_t used = 0;
            int v = std::stoi(text, &used);
            if (used != text.size()) throw std::invalid_argument(text);
            return v;
        } catch (const std::exception&) {
            throw LoaderError(LoaderErrc::InvalidSetting,
                              "Option '" + name + "' expects an integer, got '" + text + "'");
        }
    }
    return text;
}

void Options::check(const Spec& spec, const SettingValue& value) {
    if (value.index() != spec.default_value.index()) {
        throw LoaderError(LoaderErrc::InvalidSetting,
                          "Option '" + spec.name + "' expects a " + type_name(spec.default_value) +
                              ", got a " + type_name(value));
    }
    if (auto i = std::get_if<int>(&value); i && *i < 0) {
        throw LoaderError(LoaderErrc::InvalidSetting,
                          "Option '" + spec.name + "' must not be negative");
    }
}

void Options::set(const std::string& name, const SettingValue& value) {
    const Spec* spec = find_spec(name);
    if (!spec) throw LoaderError(LoaderErrc::InvalidSetting, "Unknown option: " + name);
    if (spec->scope != Scope::Global)
        throw LoaderError(LoaderErrc::InvalidSetting, "Option '" + name + "' is buffer-local");
    check(*spec, value);
    values_[name] = value;
}

void Options::parse_and_set(const std::string& name, const std::string& text) {
    set(name, parse_value(name, text));
}

SettingValue Options::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) throw LoaderError(LoaderErrc::InvalidSetting, "Unknown option: " + name);
    return it->second;
}

bool Options::get_bool(const std::string& name) const { return std::get<bool>(get(name)); }
int Options::get_int(const std::string& name) const { return std::get<int>(get(name)); }
std::string Options::get_string(const std::string& name) const { return std::get<std::string>(get(name)); }

void Options::set_local(int buffer, const std::string& name, const SettingValue& value) {
    const Spec* spec = find_spec(name);
    if (!spec || spec->scope != Scope::Buffer)
        throw LoaderError(LoaderErrc::InvalidSetting, "Unknown buffer-local option: " + name);
    check(*spec, value);
    local_[buffer][name] = value;
}

std::optional<SettingValue> Options::get_local(int buffer, const std::string& name) const {
    auto b = local_.find(buffer);
    if (b == local_.end()) return std::nullopt;
    auto it = b->second.find(name);
    if (it == b->second.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Options::changed() const {
    std::vector<std::string> out;
    for (const auto& s : schema()) {
        if (s.scope != Scope::Global) continue;
        auto it = values_.find(s.name);
        if (it != values_.end() && it->second != s.default_value) out.push_back(s.name);
    }
    return out;
}

void Options::reset() {
    values_.clear();
    local_.clear();
    for (const auto& s : schema())
        if (s.scope == Scope::Global) values_[s.name] = s.default_value;
}

} // namespace ks
