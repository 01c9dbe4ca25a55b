#include <gtest/gtest.h>
#include "ingest/ingestion_engine.hpp"
#include "invite/invitation_service.hpp"
#include "invite/token.hpp"
#include "store/memory_store.hpp"
#include "test_support.hpp"

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_map>

using namespace warmpath;
using namespace warmpath::testing_support;

namespace {

class RecordingNotifier : public Notifier {
public:
    bool fail = false;
    std::vector<InvitationNotice> notices;

    void dispatch(const InvitationNotice& notice) override {
        if (fail) throw std::runtime_error("smtp unavailable");
        notices.push_back(notice);
    }
};

IngestionConfig ingestionConfig() {
    IngestionConfig config;
    config.current_year = 2024;
    return config;
}

/// Store where a competing activation verifies the ghost just before
/// this one promotes it.
class ContendedStore : public MemoryStore {
public:
    bool verify_first = false;

    bool promoteGhost(const PersonId& id, int trust_floor,
                      const std::unordered_map<std::string, std::string>& profile) override {
        if (verify_first) MemoryStore::promoteGhost(id, trust_floor, {});
        return MemoryStore::promoteGhost(id, trust_floor, profile);
    }
};

bool isHex(const std::string& s) {
    return s.find_first_not_of("0123456789abcdef") == std::string::npos;
}

} // namespace

// ─── Tokens ────────────────────────────────────────────────────

TEST(TokenTest, TokensAreLongRandomHex) {
    std::string a = generateToken();
    std::string b = generateToken();
    EXPECT_EQ(a.size(), kTokenBytes * 2);
    EXPECT_TRUE(isHex(a));
    EXPECT_NE(a, b);

    std::string id = generateInviteId();
    EXPECT_EQ(id.rfind("invite_", 0), 0u);
    EXPECT_EQ(id.size(), 7u + 16u);
}

// ─── InvitationService ─────────────────────────────────────────

class InvitationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Person ghost = withSchool(makeGhost("g", "Gale Hart"), "State University");
        ghost.company = "Acme";
        seed(store, {
            person("req", "Rae Requester", "Acme", "Engineer"),
            ghost,
            withSchool(person("tgt", "Tia Target", "Globex", "Director"), "State University"),
        });
        engine.run();
    }

    std::vector<Relationship> edgesTouching(const PersonId& id) {
        std::vector<Relationship> out;
        for (const auto& e : store.loadEdges()) {
            if (e.touches(id)) out.push_back(e);
        }
        return out;
    }

    MemoryStore store;
    FakeClock clock;
    IngestionEngine engine{store, ExtractorRegistry::withDefaults(), ingestionConfig()};
    RecordingNotifier notifier;
    InvitationService invitations{store, engine, notifier, InviteConfig(),
                                  [this] { return clock.now; }};
};

TEST_F(InvitationServiceTest, CreateIssuesSentInvitation) {
    InvitationReceipt receipt = invitations.create("g", "req", "tgt");

    EXPECT_TRUE(receipt.email_sent);
    EXPECT_EQ(receipt.token.size(), 64u);
    EXPECT_EQ(receipt.invite_id.rfind("invite_", 0), 0u);

    auto stored = store.findInvitation(receipt.invite_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, InvitationStatus::Sent);
    EXPECT_EQ(stored->ghost_id, "g");
    EXPECT_EQ(stored->token, receipt.token);
    EXPECT_EQ(stored->expires_at - stored->created_at, std::chrono::hours(7 * 24));
    EXPECT_TRUE(stored->notification_sent);

    ASSERT_EQ(notifier.notices.size(), 1u);
    EXPECT_EQ(notifier.notices[0].ghost_name, "Gale Hart");
    EXPECT_EQ(notifier.notices[0].requester_name, "Rae Requester");
    EXPECT_EQ(notifier.notices[0].activation_link,
              "http://localhost:3000/activate/" + receipt.token);
}

TEST_F(InvitationServiceTest, TokensAreUniqueAcrossInvitations) {
    std::set<std::string> tokens;
    for (int i = 0; i < 20; i++) {
        tokens.insert(invitations.create("g", "req", "tgt").token);
    }
    EXPECT_EQ(tokens.size(), 20u);
}

TEST_F(InvitationServiceTest, CreateRejectsUnknownPeople) {
    try {
        invitations.create("missing", "req", "tgt");
        FAIL() << "expected InvitationError";
    } catch (const InvitationError& e) {
        EXPECT_EQ(e.code(), InvitationError::Code::NotFound);
    }
    EXPECT_THROW(invitations.create("g", "missing", "tgt"), InvitationError);
    EXPECT_THROW(invitations.create("g", "req", "missing"), InvitationError);
    EXPECT_TRUE(store.listInvitations().empty());
}

TEST_F(InvitationServiceTest, CreateRejectsVerifiedPerson) {
    try {
        invitations.create("req", "tgt", "tgt");
        FAIL() << "expected InvitationError";
    } catch (const InvitationError& e) {
        EXPECT_EQ(e.code(), InvitationError::Code::InvalidState);
    }
}

TEST_F(InvitationServiceTest, NotificationFailureIsRecordedNotFatal) {
    notifier.fail = true;
    InvitationReceipt receipt = invitations.create("g", "req", "tgt");

    EXPECT_FALSE(receipt.email_sent);
    auto stored = store.findInvitation(receipt.invite_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, InvitationStatus::Sent);
    EXPECT_FALSE(stored->notification_sent);
    EXPECT_EQ(stored->notification_error, "smtp unavailable");

    EXPECT_TRUE(invitations.activate(receipt.token, {}).success);
}

// ─── Activation ────────────────────────────────────────────────

TEST_F(InvitationServiceTest, ActivationPromotesAndRaisesConfidence) {
    auto before = edgesTouching("g");
    ASSERT_FALSE(before.empty());
    for (const auto& e : before) EXPECT_EQ(e.confidence, 60);

    InvitationReceipt receipt = invitations.create("g", "req", "tgt");
    ActivationData data;
    data.email = "gale@example.com";
    data.display_name = "Gale H.";
    data.preferences["digest"] = "weekly";

    ActivationResult result = invitations.activate(receipt.token, data);
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.user_id.has_value());
    EXPECT_EQ(*result.user_id, "g");
    EXPECT_EQ(result.message, "Profile activated");

    auto promoted = store.findPerson("g");
    ASSERT_TRUE(promoted.has_value());
    EXPECT_TRUE(promoted->verified);
    EXPECT_TRUE(promoted->activated);
    EXPECT_EQ(promoted->trust_score, 90);
    EXPECT_EQ(promoted->getAttribute("email"), "gale@example.com");
    EXPECT_EQ(promoted->getAttribute("pref.digest"), "weekly");

    auto after = edgesTouching("g");
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); i++) {
        EXPECT_GT(after[i].confidence, before[i].confidence);
        EXPECT_EQ(after[i].strength, before[i].strength);
    }

    auto inv = store.findInvitation(receipt.invite_id);
    EXPECT_EQ(inv->status, InvitationStatus::Accepted);
    EXPECT_TRUE(inv->accepted_at.has_value());
}

TEST_F(InvitationServiceTest, TokenIsSingleUse) {
    InvitationReceipt receipt = invitations.create("g", "req", "tgt");
    ASSERT_TRUE(invitations.activate(receipt.token, {}).success);

    ActivationResult again = invitations.activate(receipt.token, {});
    EXPECT_FALSE(again.success);
    EXPECT_FALSE(again.user_id.has_value());
    EXPECT_EQ(again.message, "Invitation already used");
}

TEST_F(InvitationServiceTest, UnknownTokenIsRejected) {
    ActivationResult result = invitations.activate("not-a-token", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Invalid invitation token");
}

TEST_F(InvitationServiceTest, SecondInvitationAfterActivationIsRejected) {
    InvitationReceipt first = invitations.create("g", "req", "tgt");
    InvitationReceipt second = invitations.create("g", "tgt", "req");
    ASSERT_TRUE(invitations.activate(first.token, {}).success);

    ActivationResult result = invitations.activate(second.token, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Profile already activated");
    EXPECT_EQ(store.findInvitation(second.invite_id)->status, InvitationStatus::Sent);
    EXPECT_THROW(invitations.create("g", "req", "tgt"), InvitationError);
}

TEST_F(InvitationServiceTest, ConcurrentActivationSucceedsOnce) {
    InvitationReceipt receipt = invitations.create("g", "req", "tgt");

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            if (invitations.activate(receipt.token, {}).success) successes++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(store.findInvitation(receipt.invite_id)->status, InvitationStatus::Accepted);
}

// ─── Expiry ────────────────────────────────────────────────────

TEST_F(InvitationServiceTest, ValidUntilExpiryInstant) {
    InvitationReceipt receipt = invitations.create("g", "req", "tgt");
    clock.advance(std::chrono::hours(7 * 24));
    EXPECT_TRUE(invitations.activate(receipt.token, {}).success);
}

TEST_F(InvitationServiceTest, ExpiresLazilyOnRead) {
    InvitationReceipt receipt = invitations.create("g", "req", "tgt");
    clock.advance(std::chrono::hours(7 * 24 + 1));

    ActivationResult result = invitations.activate(receipt.token, {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Invitation has expired");
    EXPECT_EQ(store.findInvitation(receipt.invite_id)->status, InvitationStatus::Expired);
    EXPECT_FALSE(store.findPerson("g")->verified);

    EXPECT_EQ(invitations.activate(receipt.token, {}).message, "Invitation has expired");
}

TEST_F(InvitationServiceTest, SweepExpiresOverdueAndReportsStats) {
    InvitationReceipt a = invitations.create("g", "req", "tgt");
    invitations.create("g", "req", "tgt");
    invitations.create("g", "tgt", "req");
    ASSERT_TRUE(invitations.activate(a.token, {}).success);

    EXPECT_EQ(invitations.expireInvitations(), 0u);
    clock.advance(std::chrono::hours(8 * 24));
    EXPECT_EQ(invitations.expireInvitations(), 2u);
    EXPECT_EQ(invitations.expireInvitations(), 0u);

    InvitationStats stats = invitations.stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.sent, 0u);
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.expired, 2u);
    EXPECT_NEAR(stats.conversion_rate, 100.0 / 3.0, 1e-9);
}

TEST_F(InvitationServiceTest, StatsOnEmptyStore) {
    InvitationStats stats = invitations.stats();
    EXPECT_EQ(stats.total, 0u);
    EXPECT_DOUBLE_EQ(stats.conversion_rate, 0.0);
}

TEST(InvitationStatusTest, TerminalStates) {
    EXPECT_FALSE(isTerminal(InvitationStatus::Sent));
    EXPECT_TRUE(isTerminal(InvitationStatus::Accepted));
    EXPECT_TRUE(isTerminal(InvitationStatus::Expired));
    EXPECT_EQ(toString(InvitationStatus::Expired), "expired");
}

TEST(InvitationRaceTest, LostPromotionLeavesInvitationUnused) {
    ContendedStore store;
    Person ghost = makeGhost("g", "Gale Hart");
    ghost.company = "Acme";
    seed(store, {person("req", "Rae Requester", "Acme"), ghost, person("tgt", "Tia Target", "Acme")});
    IngestionEngine engine(store, ExtractorRegistry::withDefaults(), ingestionConfig());
    engine.run();
    LogNotifier notifier;
    FakeClock clock;
    InvitationService invitations(store, engine, notifier, InviteConfig(),
                                  [&clock] { return clock.now; });

    InvitationReceipt receipt = invitations.create("g", "req", "tgt");
    store.verify_first = true;
    ActivationResult result = invitations.activate(receipt.token, ActivationData());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Profile already activated");
    auto stored = store.findInvitation(receipt.invite_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, InvitationStatus::Sent);
    EXPECT_FALSE(stored->accepted_at.has_value());

    InvitationStats stats = invitations.stats();
    EXPECT_EQ(stats.accepted, 0u);
    EXPECT_EQ(stats.sent, 1u);
    EXPECT_DOUBLE_EQ(stats.conversion_rate, 0.0);
}
