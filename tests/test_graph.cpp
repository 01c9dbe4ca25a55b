#include <gtest/gtest.h>
#include "graph/graph_index.hpp"
#include "graph/index_snapshot.hpp"
#include "graph/edge_diff.hpp"
#include "match/name_variants.hpp"
#include "util/text_util.hpp"

#include <algorithm>
#include <thread>

using namespace warmpath;

namespace {

std::vector<Person> threePeople() {
    return {Person("a", "Ann"), Person("b", "Ben"), Person("c", "Cat")};
}

std::vector<Relationship> both(const PersonId& x, const PersonId& y,
                               RelationshipType type, int strength) {
    return {Relationship(x, y, type, strength), Relationship(y, x, type, strength)};
}

} // namespace

// ─── Relationship types ────────────────────────────────────────

TEST(RelationshipTypeTest, StringRoundTrip) {
    for (RelationshipType t : kAllRelationshipTypes) {
        auto parsed = relationshipTypeFromString(toString(t));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, t);
    }
    EXPECT_EQ(relationshipTypeFromString("school"), RelationshipType::Education);
    EXPECT_EQ(relationshipTypeFromString("fraternity"), RelationshipType::Affiliation);
    EXPECT_FALSE(relationshipTypeFromString("pen_pal").has_value());
}

TEST(RelationshipTypeTest, HighTrustTypes) {
    EXPECT_TRUE(isHighTrust(RelationshipType::Coworker));
    EXPECT_TRUE(isHighTrust(RelationshipType::Education));
    EXPECT_TRUE(isHighTrust(RelationshipType::Family));
    EXPECT_FALSE(isHighTrust(RelationshipType::Hometown));
    EXPECT_FALSE(isHighTrust(RelationshipType::Social));
    EXPECT_GT(trustRank(RelationshipType::Coworker), trustRank(RelationshipType::Social));
}

// ─── GraphIndex ────────────────────────────────────────────────

TEST(GraphIndexTest, BuildAndLookup) {
    auto edges = both("a", "b", RelationshipType::Coworker, 70);
    GraphIndex index = GraphIndex::build(threePeople(), edges, 7);

    EXPECT_EQ(index.personCount(), 3u);
    EXPECT_EQ(index.edgeCount(), 2u);
    EXPECT_EQ(index.generation(), 7u);
    ASSERT_NE(index.getPerson("a"), nullptr);
    EXPECT_EQ(index.getPerson("a")->name, "Ann");
    EXPECT_EQ(index.getPerson("zz"), nullptr);
    EXPECT_EQ(index.getPersonIds(), (std::vector<PersonId>{"a", "b", "c"}));
}

TEST(GraphIndexTest, DropsOrphansAndSelfLoops) {
    std::vector<Relationship> edges = both("a", "b", RelationshipType::Coworker, 70);
    edges.emplace_back("a", "ghost", RelationshipType::Social, 30);
    edges.emplace_back("c", "c", RelationshipType::Family, 90);

    GraphIndex index = GraphIndex::build(threePeople(), edges);
    EXPECT_EQ(index.edgeCount(), 2u);
    EXPECT_EQ(index.orphanedEdges(), 2u);
    EXPECT_TRUE(index.neighbors("c").empty());
}

TEST(GraphIndexTest, NeighborsOfUnknownPersonIsEmpty) {
    GraphIndex index = GraphIndex::build(threePeople(), {});
    EXPECT_TRUE(index.neighbors("nobody").empty());
    EXPECT_TRUE(index.neighbors("a").empty());
}

TEST(GraphIndexTest, StrongestEdgePrefersStrengthThenTrustRank) {
    std::vector<Relationship> edges;
    for (auto& e : both("a", "b", RelationshipType::Hometown, 40)) edges.push_back(e);
    for (auto& e : both("a", "b", RelationshipType::Coworker, 70)) edges.push_back(e);
    for (auto& e : both("a", "c", RelationshipType::Social, 60)) edges.push_back(e);
    for (auto& e : both("a", "c", RelationshipType::Education, 60)) edges.push_back(e);

    GraphIndex index = GraphIndex::build(threePeople(), edges);

    EXPECT_EQ(index.edgesBetween("a", "b").size(), 2u);
    const Relationship* ab = index.strongestEdge("a", "b");
    ASSERT_NE(ab, nullptr);
    EXPECT_EQ(ab->type, RelationshipType::Coworker);

    const Relationship* ac = index.strongestEdge("a", "c");
    ASSERT_NE(ac, nullptr);
    EXPECT_EQ(ac->type, RelationshipType::Education);

    EXPECT_EQ(index.strongestEdge("b", "c"), nullptr);
}

TEST(GraphIndexTest, MovePreservesAdjacency) {
    GraphIndex built = GraphIndex::build(threePeople(), both("a", "b", RelationshipType::Coworker, 70));
    GraphIndex moved = std::move(built);
    const auto& adj = moved.neighbors("a");
    ASSERT_EQ(adj.size(), 1u);
    EXPECT_EQ(adj[0].edge->to, "b");
    EXPECT_EQ(adj[0].edge->strength, 70);
}

// ─── IndexSnapshot ─────────────────────────────────────────────

TEST(IndexSnapshotTest, EmptyBeforeFirstPublish) {
    IndexSnapshot snapshot;
    auto index = snapshot.current();
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->personCount(), 0u);
    EXPECT_EQ(snapshot.generation(), 0u);
}

TEST(IndexSnapshotTest, ReadersKeepOldGeneration) {
    IndexSnapshot snapshot;
    snapshot.publish(threePeople(), both("a", "b", RelationshipType::Coworker, 70));
    auto old_index = snapshot.current();

    snapshot.publish(threePeople(), {});
    auto new_index = snapshot.current();

    EXPECT_EQ(old_index->edgeCount(), 2u);
    EXPECT_EQ(new_index->edgeCount(), 0u);
    EXPECT_LT(old_index->generation(), new_index->generation());
    EXPECT_EQ(snapshot.publishCount(), 2u);
}

TEST(IndexSnapshotTest, ConcurrentPublishesEndOnNewestGeneration) {
    IndexSnapshot snapshot;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] { snapshot.publish(threePeople(), {}); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(snapshot.publishCount(), 8u);
    EXPECT_EQ(snapshot.generation(), 8u);
}

// ─── EdgeSetDiff ───────────────────────────────────────────────

TEST(EdgeSetDiffTest, DetectsAddedRemovedChanged) {
    std::vector<Relationship> before = {
        Relationship("a", "b", RelationshipType::Coworker, 70),
        Relationship("a", "c", RelationshipType::Social, 30),
    };
    std::vector<Relationship> after = {
        Relationship("a", "b", RelationshipType::Coworker, 79),
        Relationship("b", "c", RelationshipType::Hometown, 40),
    };

    EdgeSetDelta delta = EdgeSetDiff::diff(before, after);
    ASSERT_EQ(delta.added.size(), 1u);
    EXPECT_EQ(delta.added[0].to, "c");
    ASSERT_EQ(delta.removed.size(), 1u);
    EXPECT_EQ(delta.removed[0].type, RelationshipType::Social);
    ASSERT_EQ(delta.changed_after.size(), 1u);
    EXPECT_EQ(delta.changed_after[0].strength, 79);
    EXPECT_EQ(delta.size(), 3u);
}

TEST(EdgeSetDiffTest, IdenticalSetsAreEmpty) {
    auto edges = both("a", "b", RelationshipType::Coworker, 70);
    EXPECT_TRUE(EdgeSetDiff::diff(edges, edges).empty());
}

TEST(EdgeSetDiffTest, FindsDuplicateKeys) {
    std::vector<Relationship> edges = {
        Relationship("a", "b", RelationshipType::Coworker, 70),
        Relationship("a", "b", RelationshipType::Coworker, 75),
        Relationship("a", "b", RelationshipType::Social, 30),
    };
    EXPECT_EQ(EdgeSetDiff::duplicates(edges).size(), 1u);
}

// ─── Text helpers ──────────────────────────────────────────────

TEST(TextUtilTest, NormalizeCollapsesPunctuation) {
    EXPECT_EQ(text::normalize("  John  A. Smith!! "), "john a smith");
    EXPECT_EQ(text::normalize("ACME, Inc."), "acme inc");
    EXPECT_EQ(text::normalize("***"), "");
}

TEST(TextUtilTest, CanonicalCompanyStripsSuffixes) {
    EXPECT_EQ(text::canonicalCompany("Acme Corp"), "acme");
    EXPECT_EQ(text::canonicalCompany("Acme Corporation"), "acme");
    EXPECT_EQ(text::canonicalCompany("Globex Co., Ltd."), "globex");
    EXPECT_EQ(text::canonicalCompany("Company"), "company");
    EXPECT_EQ(text::canonicalCompany(""), "");
}

TEST(TextUtilTest, SurnameAndHex) {
    EXPECT_EQ(text::surname("Dana  Doe"), "doe");
    EXPECT_EQ(text::surname(""), "");
    const unsigned char bytes[] = {0x00, 0xab, 0xff};
    EXPECT_EQ(text::toHex(bytes, 3), "00abff");
}

TEST(NameVariantsTest, PersonNameVariants) {
    auto v = nameVariants("John A. Smith");
    std::vector<std::string> expected = {"john a smith", "john smith", "smith john", "j smith", "john s"};
    EXPECT_EQ(v, expected);
    EXPECT_TRUE(nameVariants("  ").empty());
    EXPECT_EQ(nameVariants("Cher"), std::vector<std::string>{"cher"});
}

TEST(NameVariantsTest, CompanyVariants) {
    auto v = companyVariants("Acme Corp");
    ASSERT_GE(v.size(), 3u);
    EXPECT_EQ(v[0], "acme corp");
    EXPECT_EQ(v[1], "acme");
    EXPECT_NE(std::find(v.begin(), v.end(), "acme corporation"), v.end());
    EXPECT_TRUE(companyVariants("").empty());
}
