/**
 * @file relay_channel.hpp
 * @brief 不透明的发布/订阅通道
 */

#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>

namespace duet::peer {

/**
 * @brief 订阅状态
 */
enum class ChannelStatus {
    Subscribed,
    ChannelError,
    TimedOut,
    Closed
};

const char* to_string(ChannelStatus status);

/**
 * @brief 中继通道
 *
 * 一个实例只订阅一个 topic。所有回调都在构造时给定的 io_context 线程上触发，
 * unsubscribe() 之后不再触发任何回调。中继不保证顺序，也不保证送达，
 * 只保证正在订阅的其他订阅者能收到，且不会回送给发布者自己。
 */
class RelayChannel {
public:
    using StatusHandler = std::function<void(ChannelStatus status, const std::string& detail)>;
    using PayloadHandler = std::function<void(const nlohmann::json& payload)>;
    using PublishHandler = std::function<void(bool ok, const std::string& error)>;

    virtual ~RelayChannel() = default;

    virtual void subscribe(const std::string& topic,
                           StatusHandler on_status,
                           PayloadHandler on_payload) = 0;

    virtual void publish(const nlohmann::json& payload, PublishHandler on_done) = 0;

    virtual void unsubscribe() = 0;
};

/**
 * @brief 每次 connect 创建一个新通道
 */
using ChannelFactory = std::function<std::shared_ptr<RelayChannel>()>;

} // namespace duet::peer
