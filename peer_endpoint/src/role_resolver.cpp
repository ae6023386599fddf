#include "peer_endpoint/role_resolver.hpp"

namespace duet::peer {

const char* to_string(NegotiationRole role) {
    return role == NegotiationRole::Leader ? "leader" : "follower";
}

NegotiationRole resolve_role(const std::string& self_id, const std::string& peer_id) {
    return self_id > peer_id ? NegotiationRole::Follower : NegotiationRole::Leader;
}

} // namespace duet::peer
