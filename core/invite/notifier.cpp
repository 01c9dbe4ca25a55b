#include "invite/notifier.hpp"

#include <spdlog/spdlog.h>

namespace warmpath {

void LogNotifier::dispatch(const InvitationNotice& notice) {
    dispatched_++;
    spdlog::info("[Notifier] Invitation {} for {}: {} wants an introduction to {} ({})",
                 notice.invite_id, notice.ghost_name, notice.requester_name,
                 notice.target_name, notice.activation_link);
}

} // namespace warmpath
