/**
 * @file topic_registry.hpp
 * @brief topic -> 订阅者 映射
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace duet::relay {

/**
 * @brief 订阅者（一个 WebSocket 连接）
 */
class Subscriber {
public:
    virtual ~Subscriber() = default;

    virtual const std::string& subscriber_id() const = 0;

    /**
     * @brief 投递一帧已编码的消息
     */
    virtual void deliver(const std::string& frame) = 0;
};

/**
 * @brief 订阅表
 *
 * 只持有订阅者的弱引用，连接销毁后在下次发布时清理
 */
class TopicRegistry {
public:
    void subscribe(const std::string& topic, const std::shared_ptr<Subscriber>& subscriber);

    void unsubscribe(const std::string& topic, const std::string& subscriber_id);

    /**
     * @brief 从所有 topic 中移除该订阅者
     */
    void remove(const std::string& subscriber_id);

    /**
     * @brief 投递给 topic 的其他订阅者（不回送给发布者）
     * @return 投递数量
     */
    std::size_t publish(const std::string& topic,
                        const std::string& publisher_id,
                        const std::string& frame);

    bool is_subscribed(const std::string& topic, const std::string& subscriber_id) const;

    std::size_t subscriber_count(const std::string& topic) const;
    std::size_t topic_count() const;

private:
    using SubscriberMap = std::map<std::string, std::weak_ptr<Subscriber>>;

    std::unordered_map<std::string, SubscriberMap> topics_;
    mutable std::mutex mutex_;
};

} // namespace duet::relay
