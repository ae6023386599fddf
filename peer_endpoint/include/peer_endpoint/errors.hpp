/**
 * @file errors.hpp
 * @brief 会话错误分类
 */

#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace duet::peer {

enum class ErrorKind {
    RelayUnavailable,      // 无法订阅中继频道（本次连接尝试失败）
    SendFailed,            // 单条信令发布失败
    NegotiationFailed,     // offer/answer/description 被本地传输拒绝
    CandidateApplyFailed,  // 单个 ICE candidate 无法应用
    MediaUnavailable       // 本地媒体获取失败
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;

    std::string describe() const;
};

/**
 * @brief 异步操作完成回调，成功时参数为 std::nullopt
 */
using CompletionHandler = std::function<void(const std::optional<Error>& error)>;

/**
 * @brief 传输层操作失败时抛出
 */
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace duet::peer
