/**
 * @file relay_client.hpp
 * @brief 信令中继客户端（房间级订阅、发送、接收）
 */

#pragma once

#include "peer_endpoint/config.hpp"
#include "peer_endpoint/errors.hpp"
#include "peer_endpoint/relay_channel.hpp"
#include "peer_endpoint/signal_message.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace duet::peer {

namespace net = boost::asio;

/**
 * @brief 中继客户端
 *
 * 每次加入房间创建一个实例，由会话协调器借用。不含任何协商逻辑。
 * 所有方法都须在 io_context 线程上调用。
 */
class RelayClient : public std::enable_shared_from_this<RelayClient> {
public:
    using MessageHandler = std::function<void(const SignalMessage& msg)>;
    using Unsubscribe = std::function<void()>;

    RelayClient(net::io_context& io_context,
                ChannelFactory channel_factory,
                std::string self_id,
                const RelayConfig& config);

    ~RelayClient();

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    /**
     * @brief 订阅房间频道
     *
     * 超时未收到订阅确认或通道报错时以 RelayUnavailable 完成。
     * 失败只影响本次尝试，可以再次调用。
     */
    void connect(const std::string& room_id, CompletionHandler on_done);

    /**
     * @brief 发送一条信令（自动填写 roomId/senderId）
     *
     * 连接进行中时等待订阅结果后再发送；未连接时以 SendFailed 完成。
     */
    void send(SignalKind kind,
              std::optional<nlohmann::json> payload,
              CompletionHandler on_done = nullptr);

    /**
     * @brief 注册消息监听
     * @return 调用后注销该监听
     */
    Unsubscribe on_message(MessageHandler handler);

    /**
     * @brief 释放订阅并清空监听
     *
     * 连接进行中时等待其结果，最多等待 disconnect_grace_ms
     */
    void disconnect(std::function<void()> on_done = nullptr);

    bool connected() const { return phase_ == Phase::Connected; }
    bool connecting() const { return phase_ == Phase::Connecting; }

    const std::string& self_id() const { return self_id_; }
    const std::string& room_id() const { return room_id_; }

    std::size_t listener_count() const { return listeners_.size(); }

private:
    enum class Phase {
        Disconnected,
        Connecting,
        Connected
    };

    struct PendingSend {
        SignalMessage message;
        CompletionHandler on_done;
    };

    void on_channel_status(uint64_t attempt, ChannelStatus status, const std::string& detail);
    void on_channel_payload(uint64_t attempt, const nlohmann::json& payload);
    void on_connect_timeout(uint64_t attempt);

    /**
     * @brief 结束当前连接尝试（成功或失败），刷新排队的发送
     */
    void finish_connect(std::optional<Error> error);

    void publish(const SignalMessage& msg, CompletionHandler on_done);

    /**
     * @brief 释放当前通道（不清空监听）
     */
    void release_channel();

    void complete_disconnect();

    ChannelFactory channel_factory_;
    std::string self_id_;
    RelayConfig config_;

    std::shared_ptr<RelayChannel> channel_;
    std::string room_id_;
    Phase phase_ = Phase::Disconnected;
    uint64_t attempt_ = 0;

    net::steady_timer connect_timer_;
    net::steady_timer grace_timer_;
    CompletionHandler connect_handler_;
    std::vector<PendingSend> pending_sends_;

    bool disconnect_pending_ = false;
    std::vector<std::function<void()>> disconnect_handlers_;

    std::map<uint64_t, MessageHandler> listeners_;
    uint64_t next_listener_id_ = 1;
};

} // namespace duet::peer
