#include "peer_endpoint/errors.hpp"

namespace duet::peer {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RelayUnavailable: return "relay_unavailable";
        case ErrorKind::SendFailed: return "send_failed";
        case ErrorKind::NegotiationFailed: return "negotiation_failed";
        case ErrorKind::CandidateApplyFailed: return "candidate_apply_failed";
        case ErrorKind::MediaUnavailable: return "media_unavailable";
    }
    return "unknown";
}

std::string Error::describe() const {
    return std::string(to_string(kind)) + ": " + message;
}

} // namespace duet::peer
