// Keystrap kernel: key notation helpers
#pragma once

#include <string>
#include <vector>

namespace ks {

// Splits a key sequence into tokens: plain characters and <...> groups.
// An unterminated '<' is treated as a literal character.
std::vector<std::string> tokenize_keys(const std::string& keys);

// Canonical spelling of one token, e.g. "<c-j>" -> "<C-j>", "<cr>" -> "<CR>",
// " " -> "<Space>". Unknown <...> names keep their case.
std::string canonical_key(const std::string& token);

// Normalises a full left-hand side. Every "<leader>" is replaced by `leader`
// (itself normalised) before canonicalisation.
std::string normalize_keys(const std::string& keys, const std::string& leader);

} // namespace ks
