/**
 * @file relay_protocol.hpp
 * @brief 中继（发布/订阅）WebSocket 帧格式
 *
 * 客户端 -> 服务器: subscribe / publish / unsubscribe
 * 服务器 -> 客户端: status / broadcast / ack
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace duet::protocol {

// op 字段取值
inline constexpr const char kOpSubscribe[]   = "subscribe";
inline constexpr const char kOpUnsubscribe[] = "unsubscribe";
inline constexpr const char kOpPublish[]     = "publish";
inline constexpr const char kOpStatus[]      = "status";
inline constexpr const char kOpBroadcast[]   = "broadcast";
inline constexpr const char kOpAck[]         = "ack";

// status 字段取值
inline constexpr const char kStatusSubscribed[]   = "SUBSCRIBED";
inline constexpr const char kStatusChannelError[] = "CHANNEL_ERROR";

// 默认事件名
inline constexpr const char kSignalEvent[] = "signal";

/**
 * @brief 一帧中继消息（未使用的字段保持默认值）
 */
struct RelayFrame {
    std::string op;
    std::string topic;
    std::string event;
    nlohmann::json payload;
    std::string status;
    std::string detail;
    int64_t ref = 0;
    bool ok = true;
};

std::string encode_frame(const RelayFrame& frame);

/**
 * @brief 解析一帧，缺少 op 或 JSON 非法时返回 std::nullopt
 */
std::optional<RelayFrame> decode_frame(const std::string& text);

RelayFrame make_subscribe(const std::string& topic);
RelayFrame make_unsubscribe(const std::string& topic);
RelayFrame make_publish(const std::string& topic, const nlohmann::json& payload, int64_t ref);
RelayFrame make_status(const std::string& topic, const std::string& status,
                       const std::string& detail = "");
RelayFrame make_broadcast(const std::string& topic, const std::string& event,
                          const nlohmann::json& payload);
RelayFrame make_ack(int64_t ref, bool ok, const std::string& detail = "");

} // namespace duet::protocol
