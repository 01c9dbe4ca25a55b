#pragma once

#include "invite/invitation.hpp"
#include "invite/notifier.hpp"
#include "ingest/ingestion_engine.hpp"
#include "store/evidence_store.hpp"

#include <functional>
#include <optional>
#include <string>

namespace warmpath {

/// Invitation lifecycle configuration parameters.
struct InviteConfig {
    int ttl_hours = 7 * 24;
    int trust_floor = 90;           // trust score after activation
    std::string activation_base_url = "http://localhost:3000";
    int max_token_attempts = 3;     // insert retries on token collision
};

using Clock = std::function<TimePoint()>;

// ─── InvitationService ─────────────────────────────────────────
// Ghost activation state machine:
//
//   sent ──accept──▶ accepted
//     └───expire──▶ expired
//
// Terminal states never change. Status moves go through the store's
// compare-and-set, so of two concurrent accepts on one token exactly
// one succeeds.

class InvitationService {
public:
    InvitationService(EvidenceStore& store,
                      IngestionEngine& engine,
                      Notifier& notifier,
                      InviteConfig config = InviteConfig(),
                      Clock clock = nullptr);

    /// Issue an invitation for `ghost_id` on behalf of `requester_id`.
    /// Throws InvitationError (NotFound / InvalidState). Notification
    /// failure is recorded but does not fail the call.
    InvitationReceipt create(const PersonId& ghost_id,
                             const PersonId& requester_id,
                             const PersonId& target_id);

    /// Accept the invitation behind `token`: promote the ghost and refresh
    /// the confidence of its edges. Rejections are reported in the result.
    ActivationResult activate(const std::string& token, const ActivationData& data);

    /// Move every overdue `sent` invitation to `expired`. Returns the count.
    size_t expireInvitations(std::optional<TimePoint> now = std::nullopt);

    InvitationStats stats() const;

    std::string activationLink(const std::string& token) const;

    const InviteConfig& config() const { return config_; }

private:
    TimePoint now() const;
    /// Dispatch the notice and record the outcome. Returns whether it was sent.
    bool notify(const Invitation& invitation, const Person& ghost,
                const Person& requester, const Person& target);

    EvidenceStore& store_;
    IngestionEngine& engine_;
    Notifier& notifier_;
    InviteConfig config_;
    Clock clock_;
};

} // namespace warmpath
