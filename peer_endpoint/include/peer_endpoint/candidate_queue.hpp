/**
 * @file candidate_queue.hpp
 * @brief 远端描述设置前到达的 ICE candidate 缓冲
 */

#pragma once

#include "peer_endpoint/signal_message.hpp"

#include <cstddef>
#include <vector>

namespace duet::peer {

class SessionTransport;

/**
 * @brief 候选队列，生命周期与一个 SessionTransport 相同
 */
class CandidateQueue {
public:
    void enqueue(const IceCandidate& candidate);

    /**
     * @brief 按到达顺序应用到传输，单个失败只记录日志
     * @return 成功应用的数量（之后队列为空）
     */
    std::size_t drain_into(SessionTransport& transport);

    std::size_t size() const { return pending_.size(); }
    bool empty() const { return pending_.empty(); }
    void clear() { pending_.clear(); }

private:
    std::vector<IceCandidate> pending_;
};

} // namespace duet::peer
