#pragma once

#include "graph/graph_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace warmpath {

/// Identity matching configuration parameters.
struct MatchConfig {
    size_t max_results = 5;
    int exact_base = 60;
    int fuzzy_base = 40;
    int exact_cap = 100;
    int fuzzy_cap = 95;
    double name_weight = 0.5;
    double company_weight = 0.3;
    double title_weight = 0.2;
    double min_fuzzy_score = 0.25;  // weighted token score needed to qualify
};

/// Free-text description of the person to reach.
struct MatchQuery {
    std::string name;
    std::string company;
    std::string title;
    std::optional<PersonId> requester;  // enables relationship boosts
};

enum class MatchTier { Exact, Fuzzy };

struct RankedMatch {
    PersonId person_id;
    std::string name;
    std::string company;
    std::string title;
    MatchTier tier = MatchTier::Fuzzy;
    int confidence = 0;  // [0, 100]
    bool is_ghost = false;

    // Direct relationship to the requester, when there is one.
    std::optional<RelationshipType> relationship_type;
    int relationship_strength = 0;

    std::vector<std::string> strength_factors;
    std::string approach_strategy;
};

/// Ranked candidates plus an advisory strategy. An empty match list is a
/// normal outcome, not an error.
struct MatchResult {
    bool found = false;
    std::vector<RankedMatch> matches;
    std::string strategy;
};

// ─── IdentityMatcher ───────────────────────────────────────────
// Resolves a name/company/title description to known people.
//   1. exact tier: name and company variants, case-insensitive
//   2. fuzzy tier (only if 1 found nothing): weighted token overlap
// Candidates are deduplicated by (name, company), boosted by their
// relationship to the requester, ranked, and capped.

class IdentityMatcher {
public:
    explicit IdentityMatcher(MatchConfig config = MatchConfig());

    MatchResult resolve(const GraphIndex& index, const MatchQuery& query) const;

    /// Weighted fraction of query tokens found in the candidate
    /// (name 50%, company 30%, title 20% by default).
    double fuzzyScore(const Person& candidate, const MatchQuery& query) const;

    const MatchConfig& config() const { return config_; }

private:
    std::vector<RankedMatch> exactMatches(const GraphIndex& index, const MatchQuery& query) const;
    std::vector<RankedMatch> fuzzyMatches(const GraphIndex& index, const MatchQuery& query) const;

    RankedMatch makeMatch(const GraphIndex& index, const MatchQuery& query,
                          const Person& person, MatchTier tier, int base) const;

    std::vector<RankedMatch> rank(std::vector<RankedMatch> matches) const;

    static std::string overallStrategy(const std::vector<RankedMatch>& matches,
                                       const MatchQuery& query);

    MatchConfig config_;
};

std::string toString(MatchTier tier);

} // namespace warmpath
