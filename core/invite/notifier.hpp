#pragma once

#include "graph/person.hpp"

#include <string>

namespace warmpath {

/// What an outbound invitation message needs to say.
struct InvitationNotice {
    std::string invite_id;
    PersonId ghost_id;
    std::string ghost_name;
    std::string requester_name;
    std::string target_name;
    std::string activation_link;
};

// ─── Notifier ──────────────────────────────────────────────────
// Delivery channel for invitation messages. dispatch() throws on
// failure; the invitation itself stays valid either way.

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void dispatch(const InvitationNotice& notice) = 0;
};

/// Writes the notice to the log instead of sending it.
class LogNotifier : public Notifier {
public:
    void dispatch(const InvitationNotice& notice) override;

    size_t dispatched() const { return dispatched_; }

private:
    size_t dispatched_ = 0;
};

} // namespace warmpath
