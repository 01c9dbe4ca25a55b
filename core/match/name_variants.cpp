#include "match/name_variants.hpp"
#include "util/text_util.hpp"

#include <algorithm>

namespace warmpath {

namespace {

void pushUnique(std::vector<std::string>& out, const std::string& v) {
    if (!v.empty() && std::find(out.begin(), out.end(), v) == out.end()) {
        out.push_back(v);
    }
}

} // namespace

std::vector<std::string> nameVariants(const std::string& name) {
    std::vector<std::string> variants;
    auto parts = text::words(name);
    if (parts.empty()) return variants;

    pushUnique(variants, text::normalize(name));
    if (parts.size() >= 2) {
        const std::string& first = parts.front();
        const std::string& last = parts.back();
        pushUnique(variants, first + " " + last);
        pushUnique(variants, last + " " + first);
        pushUnique(variants, std::string(1, first[0]) + " " + last);
        pushUnique(variants, first + " " + std::string(1, last[0]));
    }
    return variants;
}

std::vector<std::string> companyVariants(const std::string& company) {
    std::vector<std::string> variants;
    std::string normalized = text::normalize(company);
    if (normalized.empty()) return variants;

    pushUnique(variants, normalized);
    std::string base = text::canonicalCompany(company);
    pushUnique(variants, base);
    for (const auto& suffix : text::companySuffixes()) {
        pushUnique(variants, base + " " + suffix);
    }
    return variants;
}

} // namespace warmpath
