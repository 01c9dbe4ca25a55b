#include "util/text_util.hpp"

#include <algorithm>
#include <cctype>

namespace warmpath {
namespace text {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::vector<std::string> words(const std::string& s) {
    return tokenize(normalize(s));
}

const std::vector<std::string>& companySuffixes() {
    static const std::vector<std::string> suffixes = {
        "inc", "incorporated", "llc", "ltd", "limited",
        "corp", "corporation", "company", "co", "plc", "gmbh"
    };
    return suffixes;
}

std::string canonicalCompany(const std::string& company) {
    auto tokens = words(company);
    const auto& suffixes = companySuffixes();

    // keep at least one token so "Company" alone still has a key
    while (tokens.size() > 1 &&
           std::find(suffixes.begin(), suffixes.end(), tokens.back()) != suffixes.end()) {
        tokens.pop_back();
    }

    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

std::string surname(const std::string& name) {
    auto tokens = words(name);
    return tokens.empty() ? std::string() : tokens.back();
}

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string toHex(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

} // namespace text
} // namespace warmpath
