#include "peer_endpoint/candidate_queue.hpp"
#include "peer_endpoint/session_transport.hpp"

#include "duet/logger.hpp"

namespace duet::peer {

void CandidateQueue::enqueue(const IceCandidate& candidate) {
    pending_.push_back(candidate);
}

std::size_t CandidateQueue::drain_into(SessionTransport& transport) {
    std::vector<IceCandidate> pending;
    pending.swap(pending_);

    std::size_t applied = 0;
    for (const auto& candidate : pending) {
        try {
            transport.add_remote_candidate(candidate);
            ++applied;
        } catch (const std::exception& e) {
            LOG_WARN("[CandidateQueue] skipping candidate (mid=" << candidate.sdp_mid
                     << "): " << e.what());
        }
    }

    if (!pending.empty()) {
        LOG_DEBUG("[CandidateQueue] drained " << applied << "/" << pending.size() << " candidates");
    }
    return applied;
}

} // namespace duet::peer
