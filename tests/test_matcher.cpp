#include <gtest/gtest.h>
#include "graph/graph_index.hpp"
#include "match/identity_matcher.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace warmpath;
using namespace warmpath::testing_support;

namespace {

MatchQuery query(const std::string& name, const std::string& company = "",
                 const std::string& title = "") {
    MatchQuery q;
    q.name = name;
    q.company = company;
    q.title = title;
    return q;
}

bool hasFactor(const RankedMatch& m, const std::string& factor) {
    return std::find(m.strength_factors.begin(), m.strength_factors.end(), factor) !=
           m.strength_factors.end();
}

} // namespace

// ─── Fuzzy tier ────────────────────────────────────────────────

TEST(IdentityMatcherTest, JohnSmithFallsBackToFuzzy) {
    GraphIndex index = GraphIndex::build({
        person("js", "Jon Smith", "Acme Corporation", "VP Sales"),
        person("mj", "Mary Jones", "Initech", "Analyst"),
    }, {});
    IdentityMatcher matcher;

    MatchResult result = matcher.resolve(index, query("John Smith", "Acme Corp"));
    ASSERT_TRUE(result.found);
    ASSERT_EQ(result.matches.size(), 1u);

    const RankedMatch& m = result.matches[0];
    EXPECT_EQ(m.person_id, "js");
    EXPECT_EQ(m.tier, MatchTier::Fuzzy);
    EXPECT_LT(m.confidence, 95);
    EXPECT_EQ(m.confidence, 75);
    EXPECT_EQ(result.strategy,
              "Found 1 potential connection to John Smith. Good potential match: "
              "Jon Smith at Acme Corporation. Request warm introduction through mutual connection.");
}

TEST(IdentityMatcherTest, FuzzyScoreWeights) {
    IdentityMatcher matcher;
    Person jon = person("js", "Jon Smith", "Acme Corporation", "VP Sales");

    EXPECT_NEAR(matcher.fuzzyScore(jon, query("John Smith", "Acme Corp")), 0.55, 1e-9);
    EXPECT_NEAR(matcher.fuzzyScore(jon, query("Jon Smith", "Acme", "VP of Sales")), 0.5 + 0.3 + 0.2 * 2.0 / 3.0, 1e-9);
    EXPECT_NEAR(matcher.fuzzyScore(jon, query("Zed Quill")), 0.0, 1e-9);
}

TEST(IdentityMatcherTest, FuzzyConfidenceIsCapped) {
    GraphIndex index = GraphIndex::build({
        person("r", "Rae Requester", "Acme"),
        person("jo", "Jonathan Smith", "Acme", "VP Sales"),
    }, {
        Relationship("r", "jo", RelationshipType::Coworker, 95),
        Relationship("jo", "r", RelationshipType::Coworker, 95),
    });
    IdentityMatcher matcher;

    MatchQuery q = query("Jon Smith", "Acme", "VP Sales");
    q.requester = "r";
    MatchResult result = matcher.resolve(index, q);
    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.matches[0].tier, MatchTier::Fuzzy);
    EXPECT_EQ(result.matches[0].confidence, 95);
}

TEST(IdentityMatcherTest, FuzzyBelowThresholdIsDropped) {
    GraphIndex index = GraphIndex::build({person("a", "Ann Lee", "Globex", "Engineer")}, {});
    MatchResult result = IdentityMatcher().resolve(index, query("Zed Quill", "Initech", "Engineer"));
    EXPECT_FALSE(result.found);
}

// ─── Exact tier ────────────────────────────────────────────────

TEST(IdentityMatcherTest, ExactMatchThroughVariants) {
    GraphIndex index = GraphIndex::build({
        person("jd", "Jane Doe", "Acme Inc", "CTO"),
        person("jx", "Jane Doe", "Globex"),
    }, {});
    IdentityMatcher matcher;

    MatchResult result = matcher.resolve(index, query("doe, jane", "ACME"));
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].person_id, "jd");
    EXPECT_EQ(result.matches[0].tier, MatchTier::Exact);
    EXPECT_EQ(result.matches[0].confidence, 65);
    EXPECT_TRUE(hasFactor(result.matches[0], "Company information available"));
    EXPECT_TRUE(hasFactor(result.matches[0], "Role details known"));
}

TEST(IdentityMatcherTest, ExactMatchOnPastEmployer) {
    GraphIndex index = GraphIndex::build({
        withJob(person("jd", "Jane Doe", "Globex"), "Acme Corp", 2012, 2018),
    }, {});

    MatchResult result = IdentityMatcher().resolve(index, query("Jane Doe", "Acme"));
    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.matches[0].tier, MatchTier::Exact);
}

TEST(IdentityMatcherTest, InitialVariantMatches) {
    GraphIndex index = GraphIndex::build({person("js", "J Smith", "Acme")}, {});
    MatchResult result = IdentityMatcher().resolve(index, query("John Smith", "Acme"));
    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.matches[0].tier, MatchTier::Exact);
}

// ─── Boosts, factors, strategy ─────────────────────────────────

TEST(IdentityMatcherTest, RequesterRelationshipBoosts) {
    GraphIndex index = GraphIndex::build({
        person("r", "Rae Requester", "Acme"),
        person("jd", "Jane Doe", "Acme", "CTO"),
    }, {
        Relationship("r", "jd", RelationshipType::Coworker, 80),
        Relationship("jd", "r", RelationshipType::Coworker, 80),
    });

    MatchQuery q = query("Jane Doe", "Acme");
    q.requester = "r";
    MatchResult result = IdentityMatcher().resolve(index, q);
    ASSERT_EQ(result.matches.size(), 1u);

    const RankedMatch& m = result.matches[0];
    EXPECT_EQ(m.confidence, 90);  // 60 + 10 + 15 + 5
    ASSERT_TRUE(m.relationship_type.has_value());
    EXPECT_EQ(*m.relationship_type, RelationshipType::Coworker);
    EXPECT_EQ(m.relationship_strength, 80);
    EXPECT_TRUE(hasFactor(m, "Former colleague"));
    EXPECT_FALSE(hasFactor(m, "Strong relationship"));
    EXPECT_EQ(m.approach_strategy, "Leverage your work history together when requesting introduction");
    EXPECT_NE(result.strategy.find("High confidence match: Jane Doe at Acme."), std::string::npos);
}

TEST(IdentityMatcherTest, RequesterIsNeverMatched) {
    GraphIndex index = GraphIndex::build({
        person("me", "Jane Doe", "Acme"),
        person("other", "Jane Doe", "Acme Corp"),
    }, {});

    MatchQuery q = query("Jane Doe", "Acme");
    q.requester = "me";
    MatchResult result = IdentityMatcher().resolve(index, q);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].person_id, "other");
}

TEST(IdentityMatcherTest, GhostMatchSuggestsInvitation) {
    Person ghost = makeGhost("g", "Gale Hart");
    ghost.company = "Acme";
    GraphIndex index = GraphIndex::build({ghost}, {});

    MatchResult result = IdentityMatcher().resolve(index, query("Gale Hart"));
    ASSERT_TRUE(result.found);
    EXPECT_TRUE(result.matches[0].is_ghost);
    EXPECT_TRUE(hasFactor(result.matches[0], "Unverified profile"));
    EXPECT_EQ(result.matches[0].approach_strategy,
              "Invite them to activate their profile before requesting an introduction");
}

TEST(IdentityMatcherTest, BareMatchHasBasicFactor) {
    GraphIndex index = GraphIndex::build({person("p", "Pat Kim")}, {});
    MatchResult result = IdentityMatcher().resolve(index, query("Pat Kim"));
    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.matches[0].strength_factors, std::vector<std::string>{"Basic connection"});
    EXPECT_NE(result.strategy.find("Possible match: Pat Kim."), std::string::npos);
}

// ─── Dedupe and ranking ────────────────────────────────────────

TEST(IdentityMatcherTest, DeduplicatesSameNameAndCompany) {
    GraphIndex index = GraphIndex::build({
        person("j1", "Jane Doe", "Acme"),
        person("j2", "Jane  Doe", "Acme Inc."),
    }, {});

    MatchResult result = IdentityMatcher().resolve(index, query("Jane Doe"));
    ASSERT_EQ(result.matches.size(), 1u);
}

TEST(IdentityMatcherTest, CapsResultsAndRanksByConfidence) {
    std::vector<Person> persons;
    for (int i = 0; i < 7; i++) {
        persons.push_back(person("p" + std::to_string(i), "Pat Kim",
                                 "Company " + std::string(1, static_cast<char>('a' + i)),
                                 i == 6 ? "Founder" : ""));
    }
    GraphIndex index = GraphIndex::build(persons, {});

    MatchResult result = IdentityMatcher().resolve(index, query("Pat Kim"));
    ASSERT_EQ(result.matches.size(), 5u);
    EXPECT_EQ(result.matches[0].person_id, "p6");
    for (size_t i = 1; i < result.matches.size(); i++) {
        EXPECT_GE(result.matches[i - 1].confidence, result.matches[i].confidence);
    }
    EXPECT_NE(result.strategy.find("4 additional connections available as backup options."),
              std::string::npos);
}

// ─── Empty results ─────────────────────────────────────────────

TEST(IdentityMatcherTest, NoMatchIsStructuredResult) {
    GraphIndex index = GraphIndex::build({person("a", "Ann Lee", "Globex")}, {});

    MatchResult result = IdentityMatcher().resolve(index, query("Zed Quill", "Nowhere"));
    EXPECT_FALSE(result.found);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.strategy,
              "No direct connections found to Zed Quill at Nowhere. Consider expanding your "
              "network in their industry or asking mutual contacts for an introduction.");
}

TEST(IdentityMatcherTest, EmptyNameFindsNothing) {
    GraphIndex index = GraphIndex::build({person("a", "Ann Lee", "Acme")}, {});
    EXPECT_FALSE(IdentityMatcher().resolve(index, query("", "Acme")).found);
    EXPECT_EQ(toString(MatchTier::Exact), "exact");
}
