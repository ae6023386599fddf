#include "peer_endpoint/session_transport.hpp"

namespace duet::peer {

const char* to_string(TransportState state) {
    switch (state) {
        case TransportState::New: return "new";
        case TransportState::Connecting: return "connecting";
        case TransportState::Connected: return "connected";
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Failed: return "failed";
        case TransportState::Closed: return "closed";
    }
    return "unknown";
}

const char* to_string(SignalingState state) {
    switch (state) {
        case SignalingState::Stable: return "stable";
        case SignalingState::HaveLocalOffer: return "have-local-offer";
        case SignalingState::HaveRemoteOffer: return "have-remote-offer";
        case SignalingState::HaveLocalPranswer: return "have-local-pranswer";
        case SignalingState::HaveRemotePranswer: return "have-remote-pranswer";
    }
    return "unknown";
}

} // namespace duet::peer
