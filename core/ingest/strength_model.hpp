#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace warmpath {

/// Ingestion configuration parameters.
struct IngestionConfig {
    size_t max_group_size = 250;          // larger groups are sampled down
    uint64_t sampling_seed = 0x5eed;      // base seed for group sampling
    int ghost_confidence_penalty = 40;    // per ghost endpoint
    int activation_confidence_bonus = 10; // per activated endpoint
    int current_year = 0;                 // 0 = take from the system clock
    std::map<std::string, std::string> credentials;  // evidence source credentials

    bool hasCredential(const std::string& name) const {
        auto it = credentials.find(name);
        return it != credentials.end() && !it->second.empty();
    }
};

/// Base weight per relationship type. Family highest, social lowest.
int baseStrength(RelationshipType type);

/// Degree level: 3 doctorate, 2 master, 1 bachelor, 0 unknown.
int degreeLevel(const std::string& degree);

// ─── StrengthModel ─────────────────────────────────────────────
// Static per-type base weight plus contextual modifiers, and the
// endpoint-based confidence rule shared by full ingestion and ghost
// activation.

class StrengthModel {
public:
    explicit StrengthModel(const IngestionConfig& config);

    /// Overlapping tenure adds 3 per shared year (max +15); tenures
    /// known not to overlap subtract 10.
    int coworkerStrength(const Employment& a, const Employment& b) const;

    /// Graduation within 1 year +10, within 4 years +5; differing known
    /// degree levels -10.
    int educationStrength(const Education& a, const Education& b) const;

    /// Same non-empty role +5.
    int affiliationStrength(const Affiliation& a, const Affiliation& b) const;

    int hometownStrength() const;

    /// Inferred (surname) family ties are discounted by 20.
    int familyStrength(bool explicit_record) const;

    /// Mutual links +10.
    int socialStrength(bool mutual) const;

    /// 100, minus the ghost penalty per ghost endpoint, plus the
    /// activation bonus per activated endpoint, clamped to [0, 100].
    int confidence(const Person& a, const Person& b) const;

    int currentYear() const { return current_year_; }

    static int clamp(int value);

private:
    /// Inclusive overlap in years, -1 if unknown, 0 if disjoint.
    int overlapYears(const Employment& a, const Employment& b) const;

    IngestionConfig config_;
    int current_year_;
};

} // namespace warmpath
