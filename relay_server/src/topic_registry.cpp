#include "relay_server/topic_registry.hpp"

#include <vector>

namespace duet::relay {

void TopicRegistry::subscribe(const std::string& topic, const std::shared_ptr<Subscriber>& subscriber) {
    if (!subscriber) return;
    std::lock_guard<std::mutex> lock(mutex_);
    topics_[topic][subscriber->subscriber_id()] = subscriber;
}

void TopicRegistry::unsubscribe(const std::string& topic, const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(topic);
    if (it == topics_.end()) return;

    it->second.erase(subscriber_id);
    if (it->second.empty()) {
        topics_.erase(it);
    }
}

void TopicRegistry::remove(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = topics_.begin(); it != topics_.end();) {
        it->second.erase(subscriber_id);
        if (it->second.empty()) {
            it = topics_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t TopicRegistry::publish(const std::string& topic,
                                   const std::string& publisher_id,
                                   const std::string& frame) {
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = topics_.find(topic);
        if (it == topics_.end()) return 0;

        auto& subscribers = it->second;
        for (auto sub = subscribers.begin(); sub != subscribers.end();) {
            auto subscriber = sub->second.lock();
            if (!subscriber) {
                sub = subscribers.erase(sub);
                continue;
            }
            if (sub->first != publisher_id) {
                targets.push_back(std::move(subscriber));
            }
            ++sub;
        }
        if (subscribers.empty()) {
            topics_.erase(it);
        }
    }

    // 锁外投递
    for (auto& subscriber : targets) {
        subscriber->deliver(frame);
    }
    return targets.size();
}

bool TopicRegistry::is_subscribed(const std::string& topic, const std::string& subscriber_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(topic);
    return it != topics_.end() && it->second.count(subscriber_id) > 0;
}

std::size_t TopicRegistry::subscriber_count(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(topic);
    return it == topics_.end() ? 0 : it->second.size();
}

std::size_t TopicRegistry::topic_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return topics_.size();
}

} // namespace duet::relay
