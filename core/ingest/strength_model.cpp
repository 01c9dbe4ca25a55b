#include "ingest/strength_model.hpp"
#include "util/text_util.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>

namespace warmpath {

namespace {

int systemYear() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm.tm_year + 1900;
}

bool hasToken(const std::vector<std::string>& tokens, const char* needle) {
    return std::find(tokens.begin(), tokens.end(), needle) != tokens.end();
}

} // namespace

int baseStrength(RelationshipType type) {
    switch (type) {
        case RelationshipType::Family:      return 90;
        case RelationshipType::Affiliation: return 80;
        case RelationshipType::Coworker:    return 70;
        case RelationshipType::Education:   return 60;
        case RelationshipType::Hometown:    return 40;
        case RelationshipType::Social:      return 30;
    }
    return 30;
}

int degreeLevel(const std::string& degree) {
    std::string n = text::normalize(degree);
    auto tokens = text::tokenize(n);
    if (n.find("phd") != std::string::npos || n.find("doctor") != std::string::npos ||
        hasToken(tokens, "md") || hasToken(tokens, "jd") || hasToken(tokens, "dphil")) {
        return 3;
    }
    if (n.find("master") != std::string::npos || hasToken(tokens, "mba") ||
        hasToken(tokens, "ms") || hasToken(tokens, "ma") || hasToken(tokens, "msc") ||
        hasToken(tokens, "meng")) {
        return 2;
    }
    if (n.find("bachelor") != std::string::npos || hasToken(tokens, "bs") ||
        hasToken(tokens, "ba") || hasToken(tokens, "bsc") || hasToken(tokens, "beng")) {
        return 1;
    }
    return 0;
}

StrengthModel::StrengthModel(const IngestionConfig& config)
    : config_(config),
      current_year_(config.current_year > 0 ? config.current_year : systemYear()) {}

int StrengthModel::clamp(int value) {
    return std::max(0, std::min(100, value));
}

int StrengthModel::overlapYears(const Employment& a, const Employment& b) const {
    if (a.start_year <= 0 || b.start_year <= 0) return -1;
    int a_end = a.end_year > 0 ? a.end_year : current_year_;
    int b_end = b.end_year > 0 ? b.end_year : current_year_;
    int lo = std::max(a.start_year, b.start_year);
    int hi = std::min(a_end, b_end);
    return hi >= lo ? (hi - lo + 1) : 0;
}

int StrengthModel::coworkerStrength(const Employment& a, const Employment& b) const {
    int strength = baseStrength(RelationshipType::Coworker);
    int overlap = overlapYears(a, b);
    if (overlap > 0) {
        strength += std::min(15, 3 * overlap);
    } else if (overlap == 0) {
        strength -= 10;
    }
    return clamp(strength);
}

int StrengthModel::educationStrength(const Education& a, const Education& b) const {
    int strength = baseStrength(RelationshipType::Education);
    if (a.graduation_year > 0 && b.graduation_year > 0) {
        int gap = std::abs(a.graduation_year - b.graduation_year);
        if (gap <= 1) {
            strength += 10;
        } else if (gap <= 4) {
            strength += 5;
        }
    }
    int la = degreeLevel(a.degree);
    int lb = degreeLevel(b.degree);
    if (la > 0 && lb > 0 && la != lb) {
        strength -= 10;
    }
    return clamp(strength);
}

int StrengthModel::affiliationStrength(const Affiliation& a, const Affiliation& b) const {
    int strength = baseStrength(RelationshipType::Affiliation);
    std::string ra = text::normalize(a.role);
    if (!ra.empty() && ra == text::normalize(b.role)) {
        strength += 5;
    }
    return clamp(strength);
}

int StrengthModel::hometownStrength() const {
    return baseStrength(RelationshipType::Hometown);
}

int StrengthModel::familyStrength(bool explicit_record) const {
    int strength = baseStrength(RelationshipType::Family);
    if (!explicit_record) strength -= 20;
    return clamp(strength);
}

int StrengthModel::socialStrength(bool mutual) const {
    int strength = baseStrength(RelationshipType::Social);
    if (mutual) strength += 10;
    return clamp(strength);
}

int StrengthModel::confidence(const Person& a, const Person& b) const {
    int c = 100;
    for (const Person* p : {&a, &b}) {
        if (p->isGhost()) {
            c -= config_.ghost_confidence_penalty;
        } else if (p->activated) {
            c += config_.activation_confidence_bonus;
        }
    }
    return clamp(c);
}

} // namespace warmpath
