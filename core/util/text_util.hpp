#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace warmpath {
namespace text {

/// Lowercase, keep letters and digits, turn everything else into single
/// spaces, trim.
std::string normalize(const std::string& s);

/// Split normalized text on spaces. Drops empty tokens only.
std::vector<std::string> tokenize(const std::string& normalized);

/// normalize() then tokenize().
std::vector<std::string> words(const std::string& s);

/// Corporate suffixes recognised by canonicalCompany() and the matcher's
/// company variants ("inc", "llc", "corp", ...), already normalized.
const std::vector<std::string>& companySuffixes();

/// Normalized company name with trailing corporate suffixes removed.
/// "Acme Corp." and "ACME, Inc" both become "acme".
std::string canonicalCompany(const std::string& company);

/// Last word of the normalized name, or "" for empty names.
std::string surname(const std::string& name);

/// 64-bit FNV-1a. Used to derive stable per-group sampling seeds.
uint64_t fnv1a(const std::string& s);

/// Lowercase hex encoding.
std::string toHex(const unsigned char* data, size_t len);

} // namespace text
} // namespace warmpath
