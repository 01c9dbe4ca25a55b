#include "invite/invitation_service.hpp"
#include "invite/token.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace warmpath {

namespace {

ActivationResult rejected(const std::string& message) {
    ActivationResult r;
    r.success = false;
    r.message = message;
    return r;
}

std::unordered_map<std::string, std::string> profileFields(const ActivationData& data) {
    std::unordered_map<std::string, std::string> profile;
    if (!data.email.empty()) profile["email"] = data.email;
    if (!data.display_name.empty()) profile["display_name"] = data.display_name;
    for (const auto& [k, v] : data.preferences) {
        profile["pref." + k] = v;
    }
    return profile;
}

} // namespace

InvitationService::InvitationService(EvidenceStore& store,
                                     IngestionEngine& engine,
                                     Notifier& notifier,
                                     InviteConfig config,
                                     Clock clock)
    : store_(store), engine_(engine), notifier_(notifier),
      config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

TimePoint InvitationService::now() const {
    return clock_();
}

std::string InvitationService::activationLink(const std::string& token) const {
    return config_.activation_base_url + "/activate/" + token;
}

// ─── Create ────────────────────────────────────────────────────

InvitationReceipt InvitationService::create(const PersonId& ghost_id,
                                            const PersonId& requester_id,
                                            const PersonId& target_id) {
    auto ghost = store_.findPerson(ghost_id);
    if (!ghost) {
        throw InvitationError(InvitationError::Code::NotFound,
                              "Ghost profile not found: " + ghost_id);
    }
    if (ghost->verified) {
        throw InvitationError(InvitationError::Code::InvalidState,
                              "Profile already verified: " + ghost_id);
    }
    auto requester = store_.findPerson(requester_id);
    if (!requester) {
        throw InvitationError(InvitationError::Code::NotFound,
                              "Requester not found: " + requester_id);
    }
    auto target = store_.findPerson(target_id);
    if (!target) {
        throw InvitationError(InvitationError::Code::NotFound,
                              "Target not found: " + target_id);
    }

    Invitation inv;
    inv.ghost_id = ghost_id;
    inv.requester_id = requester_id;
    inv.target_id = target_id;
    inv.status = InvitationStatus::Sent;
    inv.created_at = now();
    inv.expires_at = inv.created_at + std::chrono::hours(config_.ttl_hours);

    for (int attempt = 1;; attempt++) {
        inv.id = generateInviteId();
        inv.token = generateToken();
        try {
            store_.insertInvitation(inv);
            break;
        } catch (const StoreError& e) {
            if (attempt >= config_.max_token_attempts) throw;
            spdlog::warn("[InvitationService] Insert attempt {} failed: {}", attempt, e.what());
        }
    }
    spdlog::info("[InvitationService] Created {} for ghost {} ({} -> {})",
                 inv.id, ghost_id, requester_id, target_id);

    inv.notification_sent = notify(inv, *ghost, *requester, *target);

    InvitationReceipt receipt;
    receipt.invite_id = inv.id;
    receipt.token = inv.token;
    receipt.email_sent = inv.notification_sent;
    return receipt;
}

bool InvitationService::notify(const Invitation& invitation, const Person& ghost,
                               const Person& requester, const Person& target) {
    InvitationNotice notice;
    notice.invite_id = invitation.id;
    notice.ghost_id = ghost.id;
    notice.ghost_name = ghost.name;
    notice.requester_name = requester.name;
    notice.target_name = target.name;
    notice.activation_link = activationLink(invitation.token);

    bool sent = false;
    std::string error;
    try {
        notifier_.dispatch(notice);
        sent = true;
    } catch (const std::exception& e) {
        error = e.what();
        spdlog::warn("[InvitationService] Notification for {} failed: {}", invitation.id, error);
    }

    try {
        store_.recordNotification(invitation.id, sent, error);
    } catch (const StoreError& e) {
        spdlog::error("[InvitationService] Could not record notification for {}: {}",
                      invitation.id, e.what());
    }
    return sent;
}

// ─── Accept ────────────────────────────────────────────────────

ActivationResult InvitationService::activate(const std::string& token, const ActivationData& data) {
    auto inv = store_.findInvitationByToken(token);
    if (!inv) {
        return rejected("Invalid invitation token");
    }
    if (inv->status == InvitationStatus::Accepted) {
        return rejected("Invitation already used");
    }
    if (inv->status == InvitationStatus::Expired) {
        return rejected("Invitation has expired");
    }

    TimePoint at = now();
    if (inv->isExpiredAt(at)) {
        if (store_.transitionInvitation(inv->id, InvitationStatus::Sent,
                                        InvitationStatus::Expired, at)) {
            spdlog::info("[InvitationService] {} expired on read", inv->id);
        }
        return rejected("Invitation has expired");
    }

    auto ghost = store_.findPerson(inv->ghost_id);
    if (!ghost) {
        return rejected("Profile not found");
    }
    if (ghost->verified) {
        return rejected("Profile already activated");
    }

    if (!store_.transitionInvitation(inv->id, InvitationStatus::Sent,
                                     InvitationStatus::Accepted, at)) {
        // Lost the race: someone else moved it out of `sent` first.
        auto current = store_.findInvitation(inv->id);
        if (current && current->status == InvitationStatus::Expired) {
            return rejected("Invitation has expired");
        }
        return rejected("Invitation already used");
    }

    if (!store_.promoteGhost(ghost->id, config_.trust_floor, profileFields(data))) {
        // Another invitation for the same ghost won; this one was not used.
        if (!store_.transitionInvitation(inv->id, InvitationStatus::Accepted,
                                         InvitationStatus::Sent, at)) {
            spdlog::error("[InvitationService] Could not return {} to sent", inv->id);
        }
        spdlog::warn("[InvitationService] {} was verified before {} was accepted",
                     ghost->id, inv->id);
        return rejected("Profile already activated");
    }
    size_t updated = engine_.refreshConfidence(ghost->id);
    spdlog::info("[InvitationService] Activated {} via {}; {} edges re-weighted",
                 ghost->id, inv->id, updated);

    ActivationResult result;
    result.success = true;
    result.user_id = ghost->id;
    result.message = "Profile activated";
    return result;
}

// ─── Expire ────────────────────────────────────────────────────

size_t InvitationService::expireInvitations(std::optional<TimePoint> at) {
    TimePoint t = at.value_or(now());
    size_t expired = 0;
    for (const auto& inv : store_.listInvitations()) {
        if (inv.status != InvitationStatus::Sent || !inv.isExpiredAt(t)) continue;
        if (store_.transitionInvitation(inv.id, InvitationStatus::Sent,
                                        InvitationStatus::Expired, t)) {
            expired++;
        }
    }
    if (expired > 0) {
        spdlog::info("[InvitationService] Expired {} invitations", expired);
    }
    return expired;
}

InvitationStats InvitationService::stats() const {
    InvitationStats s;
    for (const auto& inv : store_.listInvitations()) {
        s.total++;
        switch (inv.status) {
            case InvitationStatus::Sent:     s.sent++; break;
            case InvitationStatus::Accepted: s.accepted++; break;
            case InvitationStatus::Expired:  s.expired++; break;
        }
    }
    if (s.total > 0) {
        s.conversion_rate = 100.0 * static_cast<double>(s.accepted) / static_cast<double>(s.total);
    }
    return s;
}

} // namespace warmpath
