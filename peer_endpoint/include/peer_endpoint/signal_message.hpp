/**
 * @file signal_message.hpp
 * @brief 房间内交换的信令消息
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace duet::peer {

enum class SignalKind {
    Join,
    Offer,
    Answer,
    IceCandidate,
    Leave,
    Kick
};

/**
 * @brief 信令消息
 *
 * payload 仅 Offer/Answer/IceCandidate 携带（会话描述或网络候选）
 */
struct SignalMessage {
    SignalKind kind = SignalKind::Join;
    std::optional<nlohmann::json> payload;
    std::string room_id;
    std::string sender_id;
};

/**
 * @brief 线上类型名: "join" | "offer" | "answer" | "ice-candidate" | "leave" | "kick"
 */
const char* kind_to_string(SignalKind kind);
std::optional<SignalKind> kind_from_string(const std::string& name);

nlohmann::json message_to_json(const SignalMessage& msg);

/**
 * @brief 解析线上消息，类型未知或缺少 roomId/senderId 时返回 std::nullopt
 */
std::optional<SignalMessage> json_to_message(const nlohmann::json& j);

// 会话描述 {"type","sdp"}
struct SessionDescription {
    std::string type;
    std::string sdp;
};

// 网络候选 {"candidate","sdpMid","sdpMLineIndex"}
struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = -1;
};

nlohmann::json description_to_json(const SessionDescription& desc);
std::optional<SessionDescription> json_to_description(const nlohmann::json& j);

nlohmann::json candidate_to_json(const IceCandidate& cand);
std::optional<IceCandidate> json_to_candidate(const nlohmann::json& j);

} // namespace duet::peer
