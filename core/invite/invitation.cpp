#include "invite/invitation.hpp"

namespace warmpath {

std::string toString(InvitationStatus status) {
    switch (status) {
        case InvitationStatus::Sent:     return "sent";
        case InvitationStatus::Accepted: return "accepted";
        case InvitationStatus::Expired:  return "expired";
    }
    return "sent";
}

} // namespace warmpath
