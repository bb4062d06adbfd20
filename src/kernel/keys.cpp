// Keystrap kernel: key notation normalisation
#include "kernel/keys.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace ks {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::map<std::string, std::string>& key_names() {
    static const std::map<std::string, std::string> names = {
        {"cr", "CR"},       {"return", "CR"},     {"enter", "CR"},
        {"tab", "Tab"},     {"space", "Space"},   {"esc", "Esc"},
        {"bs", "BS"},       {"backspace", "BS"},  {"del", "Del"},
        {"up", "Up"},       {"down", "Down"},     {"left", "Left"},
        {"right", "Right"}, {"home", "Home"},     {"end", "End"},
        {"pageup", "PageUp"}, {"pagedown", "PageDown"},
        {"lt", "lt"},       {"bar", "Bar"},       {"bslash", "Bslash"},
        {"nop", "Nop"},     {"leader", "Leader"}, {"insert", "Insert"},
    };
    return names;
}

// Canonical modifier letter, or 0 when `c` is not a modifier.
char modifier(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'C': return 'C';
        case 'S': return 'S';
        case 'M':
        case 'A': return 'M';
        case 'D': return 'D';
        default: return 0;
    }
}

std::string canonical_name(const std::string& name) {
    if (name.size() == 1) return name;
    auto l = lower(name);
    auto it = key_names().find(l);
    if (it != key_names().end()) return it->second;
    if (l.size() >= 2 && l[0] == 'f' &&
        std::all_of(l.begin() + 1, l.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return "F" + l.substr(1);
    }
    return name;
}

}  // namespace

std::vector<std::string> tokenize_keys(const std::string& keys) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < keys.size()) {
        if (keys[i] == '<') {
            auto close = keys.find('>', i + 1);
            // "<>" and unterminated groups are literal '<'.
            if (close != std::string::npos && close > i + 1) {
                tokens.push_back(keys.substr(i, close - i + 1));
                i = close + 1;
                continue;
            }
        }
        tokens.push_back(std::string(1, keys[i]));
        ++i;
    }
    return tokens;
}

std::string canonical_key(const std::string& token) {
    if (token == " ") return "<Space>";
    if (token.size() < 3 || token.front() != '<' || token.back() != '>') return token;

    std::string inner = token.substr(1, token.size() - 2);
    std::string mods;
    while (inner.size() >= 3 && inner[1] == '-' && modifier(inner[0])) {
        char m = modifier(inner[0]);
        if (mods.find(m) == std::string::npos) mods.push_back(m);
        inner = inner.substr(2);
    }
    std::string key = canonical_name(inner);
    if (mods.empty()) return "<" + key + ">";

    static const std::string order = "CMSD";
    std::sort(mods.begin(), mods.end(),
              [](char a, char b) { return order.find(a) < order.find(b); });
    std::string out = "<";
    for (char m : mods) {
        out.push_back(m);
        out.push_back('-');
    }
    return out + key + ">";
}

std::string normalize_keys(const std::string& keys, const std::string& leader) {
    std::string out;
    for (const auto& tok : tokenize_keys(keys)) {
        if (lower(tok) == "<leader>") {
            for (const auto& lt : tokenize_keys(leader)) out += canonical_key(lt);
        } else {
            out += canonical_key(tok);
        }
    }
    return out;
}

} // namespace ks
