/**
 * @file session_status.hpp
 * @brief 会话对外可见的状态
 */

#pragma once

#include <optional>
#include <string>

namespace duet::peer {

/**
 * @brief 协调器状态
 */
enum class SessionState {
    Idle,                  // 尚未加入房间
    AwaitingCounterpart,   // 已订阅，等待对端
    Negotiating,           // offer/answer 交换中
    Connected,             // 直连已建立
    Failed,                // 中继不可用
    Closed                 // 已退出房间
};

const char* to_string(SessionState state);

/**
 * @brief 展示层读取的状态值
 */
struct SessionStatus {
    bool connected = false;
    bool connecting = false;
    std::optional<std::string> error;
};

inline bool operator==(const SessionStatus& a, const SessionStatus& b) {
    return a.connected == b.connected && a.connecting == b.connecting && a.error == b.error;
}

inline bool operator!=(const SessionStatus& a, const SessionStatus& b) {
    return !(a == b);
}

/**
 * @brief 退出房间的原因
 */
enum class ExitReason {
    Removed,            // 被对端踢出
    InactivityTimeout   // 长时间无人连接
};

const char* to_string(ExitReason reason);

} // namespace duet::peer
