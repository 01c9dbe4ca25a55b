#include "match/identity_matcher.hpp"
#include "match/name_variants.hpp"
#include "util/text_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace warmpath {

namespace {

/// Companies a person is known by: current plus employment history.
std::vector<std::string> companiesOf(const Person& p) {
    std::vector<std::string> out;
    if (!p.company.empty()) out.push_back(p.company);
    for (const auto& job : p.employment) {
        if (!job.company.empty()) out.push_back(job.company);
    }
    return out;
}

std::vector<std::string> titlesOf(const Person& p) {
    std::vector<std::string> out;
    if (!p.title.empty()) out.push_back(p.title);
    for (const auto& job : p.employment) {
        if (!job.title.empty()) out.push_back(job.title);
    }
    return out;
}

/// Fraction of `query` tokens that substring-match some candidate token
/// in either direction.
double overlap(const std::vector<std::string>& query, const std::set<std::string>& candidate) {
    if (query.empty()) return 0.0;
    size_t hits = 0;
    for (const auto& q : query) {
        for (const auto& c : candidate) {
            if (c.find(q) != std::string::npos || q.find(c) != std::string::npos) {
                hits++;
                break;
            }
        }
    }
    return static_cast<double>(hits) / query.size();
}

std::vector<std::string> companyTokens(const std::string& company) {
    return text::tokenize(text::canonicalCompany(company));
}

std::string atCompany(const std::string& company) {
    return company.empty() ? "" : " at " + company;
}

std::vector<std::string> strengthFactors(const RankedMatch& m) {
    std::vector<std::string> factors;
    if (m.relationship_type) {
        if (m.relationship_strength > 80) factors.push_back("Strong relationship");
        if (*m.relationship_type == RelationshipType::Coworker) factors.push_back("Former colleague");
        if (*m.relationship_type == RelationshipType::Education) factors.push_back("Alumni connection");
    }
    if (!m.company.empty()) factors.push_back("Company information available");
    if (!m.title.empty()) factors.push_back("Role details known");
    if (m.is_ghost) factors.push_back("Unverified profile");
    if (factors.empty()) factors.push_back("Basic connection");
    return factors;
}

std::string approachStrategy(const RankedMatch& m) {
    if (m.is_ghost) {
        return "Invite them to activate their profile before requesting an introduction";
    }
    if (m.relationship_type == RelationshipType::Coworker) {
        return "Leverage your work history together when requesting introduction";
    }
    if (m.relationship_type == RelationshipType::Education) {
        return "Mention your shared educational background as common ground";
    }
    if (m.relationship_type && m.relationship_strength > 80) {
        return "Request direct introduction from your strong mutual connection";
    }
    return "Request warm introduction through mutual connection";
}

} // namespace

std::string toString(MatchTier tier) {
    return tier == MatchTier::Exact ? "exact" : "fuzzy";
}

IdentityMatcher::IdentityMatcher(MatchConfig config) : config_(std::move(config)) {}

double IdentityMatcher::fuzzyScore(const Person& candidate, const MatchQuery& query) const {
    std::set<std::string> name_tokens;
    for (auto& t : text::words(candidate.name)) name_tokens.insert(t);

    std::set<std::string> company_tokens;
    for (const auto& c : companiesOf(candidate)) {
        for (auto& t : companyTokens(c)) company_tokens.insert(t);
    }

    std::set<std::string> title_tokens;
    for (const auto& t : titlesOf(candidate)) {
        for (auto& w : text::words(t)) title_tokens.insert(w);
    }

    return config_.name_weight * overlap(text::words(query.name), name_tokens) +
           config_.company_weight * overlap(companyTokens(query.company), company_tokens) +
           config_.title_weight * overlap(text::words(query.title), title_tokens);
}

RankedMatch IdentityMatcher::makeMatch(const GraphIndex& index, const MatchQuery& query,
                                       const Person& person, MatchTier tier, int base) const {
    RankedMatch m;
    m.person_id = person.id;
    m.name = person.name;
    m.company = person.company;
    m.title = person.title;
    m.tier = tier;
    m.is_ghost = person.isGhost();

    int confidence = base;
    if (query.requester) {
        if (const Relationship* e = index.strongestEdge(*query.requester, person.id)) {
            m.relationship_type = e->type;
            m.relationship_strength = e->strength;
            if (e->strength > 75) confidence += 10;
            if (e->strength > 90) confidence += 5;
            if (e->type == RelationshipType::Coworker || e->type == RelationshipType::Education) {
                confidence += 15;
            }
        }
    }
    if (!m.company.empty() && !m.title.empty()) confidence += 5;

    int cap = tier == MatchTier::Exact ? config_.exact_cap : config_.fuzzy_cap;
    m.confidence = std::max(0, std::min(cap, confidence));
    m.strength_factors = strengthFactors(m);
    m.approach_strategy = approachStrategy(m);
    return m;
}

std::vector<RankedMatch> IdentityMatcher::exactMatches(const GraphIndex& index,
                                                       const MatchQuery& query) const {
    std::vector<RankedMatch> matches;
    auto names = nameVariants(query.name);
    auto companies = companyVariants(query.company);
    if (names.empty()) return matches;

    for (const auto& id : index.getPersonIds()) {
        if (query.requester && id == *query.requester) continue;
        const Person* p = index.getPerson(id);

        std::string stored = text::normalize(p->name);
        if (std::find(names.begin(), names.end(), stored) == names.end()) continue;

        if (!companies.empty()) {
            bool company_hit = false;
            for (const auto& c : companiesOf(*p)) {
                if (std::find(companies.begin(), companies.end(), text::normalize(c)) != companies.end()) {
                    company_hit = true;
                    break;
                }
            }
            if (!company_hit) continue;
        }
        matches.push_back(makeMatch(index, query, *p, MatchTier::Exact, config_.exact_base));
    }
    return matches;
}

std::vector<RankedMatch> IdentityMatcher::fuzzyMatches(const GraphIndex& index,
                                                       const MatchQuery& query) const {
    std::vector<RankedMatch> matches;
    for (const auto& id : index.getPersonIds()) {
        if (query.requester && id == *query.requester) continue;
        const Person* p = index.getPerson(id);

        double s = fuzzyScore(*p, query);
        if (s < config_.min_fuzzy_score) continue;

        int base = config_.fuzzy_base +
                   static_cast<int>(std::lround(s * (config_.fuzzy_cap - config_.fuzzy_base)));
        matches.push_back(makeMatch(index, query, *p, MatchTier::Fuzzy, base));
    }
    return matches;
}

std::vector<RankedMatch> IdentityMatcher::rank(std::vector<RankedMatch> matches) const {
    // Deduplicate by (name, company), keeping the most confident entry.
    std::map<std::pair<std::string, std::string>, RankedMatch> unique;
    for (auto& m : matches) {
        auto key = std::make_pair(text::normalize(m.name), text::canonicalCompany(m.company));
        auto it = unique.find(key);
        if (it == unique.end() || m.confidence > it->second.confidence) {
            unique[key] = std::move(m);
        }
    }

    std::vector<RankedMatch> ranked;
    ranked.reserve(unique.size());
    for (auto& [_, m] : unique) ranked.push_back(std::move(m));

    std::sort(ranked.begin(), ranked.end(), [](const RankedMatch& a, const RankedMatch& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.name != b.name) return a.name < b.name;
        return a.person_id < b.person_id;
    });
    if (ranked.size() > config_.max_results) ranked.resize(config_.max_results);
    return ranked;
}

std::string IdentityMatcher::overallStrategy(const std::vector<RankedMatch>& matches,
                                             const MatchQuery& query) {
    if (matches.empty()) {
        return "No direct connections found to " + query.name + atCompany(query.company) +
               ". Consider expanding your network in their industry or asking mutual "
               "contacts for an introduction.";
    }

    const RankedMatch& best = matches.front();
    size_t total = matches.size();

    std::string strategy = "Found " + std::to_string(total) + " potential connection" +
                           (total > 1 ? "s" : "") + " to " + query.name + ". ";
    if (best.confidence > 80) {
        strategy += "High confidence match: ";
    } else if (best.confidence > 60) {
        strategy += "Good potential match: ";
    } else {
        strategy += "Possible match: ";
    }
    strategy += best.name + atCompany(best.company) + ". " + best.approach_strategy + ".";

    if (total > 1) {
        strategy += " " + std::to_string(total - 1) + " additional connection" +
                    (total > 2 ? "s" : "") + " available as backup options.";
    }
    return strategy;
}

MatchResult IdentityMatcher::resolve(const GraphIndex& index, const MatchQuery& query) const {
    MatchResult result;

    if (!text::normalize(query.name).empty()) {
        auto matches = exactMatches(index, query);
        if (matches.empty()) {
            matches = fuzzyMatches(index, query);
        }
        result.matches = rank(std::move(matches));
    }

    result.found = !result.matches.empty();
    result.strategy = overallStrategy(result.matches, query);
    spdlog::debug("[IdentityMatcher] '{}'{}: {} matches", query.name, atCompany(query.company),
                  result.matches.size());
    return result;
}

} // namespace warmpath
