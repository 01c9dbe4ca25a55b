#pragma once

#include "graph/person.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace warmpath {

using TimePoint = std::chrono::system_clock::time_point;

/// `Sent` is initial; `Accepted` and `Expired` are terminal.
enum class InvitationStatus {
    Sent,
    Accepted,
    Expired
};

std::string toString(InvitationStatus status);

inline bool isTerminal(InvitationStatus status) {
    return status != InvitationStatus::Sent;
}

/// Invitation asking a ghost intermediary to activate their profile so an
/// introduction from `requester_id` to `target_id` can go through them.
struct Invitation {
    std::string id;
    PersonId ghost_id;
    PersonId requester_id;
    PersonId target_id;
    std::string token;  // single-use secret
    InvitationStatus status = InvitationStatus::Sent;
    TimePoint created_at{};
    TimePoint expires_at{};
    std::optional<TimePoint> accepted_at;
    bool notification_sent = false;
    std::string notification_error;

    bool isExpiredAt(TimePoint now) const { return now > expires_at; }
};

/// Returned by createInvitation.
struct InvitationReceipt {
    std::string invite_id;
    std::string token;
    bool email_sent = false;
};

/// Profile details supplied by the person accepting an invitation.
struct ActivationData {
    std::string email;
    std::string display_name;
    std::unordered_map<std::string, std::string> preferences;
};

struct ActivationResult {
    bool success = false;
    std::optional<PersonId> user_id;
    std::string message;
};

struct InvitationStats {
    size_t total = 0;
    size_t sent = 0;
    size_t accepted = 0;
    size_t expired = 0;
    double conversion_rate = 0.0;  // accepted / total, percent
};

/// createInvitation was rejected.
class InvitationError : public std::runtime_error {
public:
    enum class Code { NotFound, InvalidState };

    InvitationError(Code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

} // namespace warmpath
