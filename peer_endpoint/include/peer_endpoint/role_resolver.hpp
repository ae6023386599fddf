/**
 * @file role_resolver.hpp
 * @brief 协商角色判定
 */

#pragma once

#include <string>

namespace duet::peer {

/**
 * @brief 协商角色
 *
 * Leader（impolite）发起 Offer，Follower（polite）等待并回复 Answer
 */
enum class NegotiationRole {
    Leader,
    Follower
};

const char* to_string(NegotiationRole role);

/**
 * @brief 由双方标识确定本端角色
 *
 * self_id 按字典序大于 peer_id 时为 Follower，否则为 Leader。
 * 双方用同一对标识独立计算，结果恰好一个 Leader 一个 Follower。
 */
NegotiationRole resolve_role(const std::string& self_id, const std::string& peer_id);

} // namespace duet::peer
