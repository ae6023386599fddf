#include "peer_endpoint/session_status.hpp"

namespace duet::peer {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::AwaitingCounterpart: return "awaiting-counterpart";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Connected: return "connected";
        case SessionState::Failed: return "failed";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

const char* to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::Removed: return "removed";
        case ExitReason::InactivityTimeout: return "inactivity-timeout";
    }
    return "unknown";
}

} // namespace duet::peer
