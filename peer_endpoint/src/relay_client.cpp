/**
 * @file relay_client.cpp
 * @brief 信令中继客户端实现
 */

#include "peer_endpoint/relay_client.hpp"

#include "duet/logger.hpp"

#include <chrono>

namespace duet::peer {

const char* to_string(ChannelStatus status) {
    switch (status) {
        case ChannelStatus::Subscribed: return "SUBSCRIBED";
        case ChannelStatus::ChannelError: return "CHANNEL_ERROR";
        case ChannelStatus::TimedOut: return "TIMED_OUT";
        case ChannelStatus::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

RelayClient::RelayClient(net::io_context& io_context,
                         ChannelFactory channel_factory,
                         std::string self_id,
                         const RelayConfig& config)
    : channel_factory_(std::move(channel_factory))
    , self_id_(std::move(self_id))
    , config_(config)
    , connect_timer_(io_context)
    , grace_timer_(io_context) {}

RelayClient::~RelayClient() {
    connect_timer_.cancel();
    grace_timer_.cancel();
    if (channel_) {
        try {
            channel_->unsubscribe();
        } catch (const std::exception& e) {
            LOG_ERROR("[RelayClient] unsubscribe failed: " << e.what());
        }
    }
}

void RelayClient::connect(const std::string& room_id, CompletionHandler on_done) {
    if (phase_ == Phase::Connecting) {
        finish_connect(Error{ErrorKind::RelayUnavailable, "superseded by a new connect"});
    }
    release_channel();

    room_id_ = room_id;
    phase_ = Phase::Connecting;
    connect_handler_ = std::move(on_done);
    const uint64_t attempt = ++attempt_;

    try {
        channel_ = channel_factory_();
    } catch (const std::exception& e) {
        LOG_ERROR("[RelayClient] cannot create relay channel: " << e.what());
    }
    if (!channel_) {
        finish_connect(Error{ErrorKind::RelayUnavailable, "relay channel unavailable"});
        return;
    }

    const std::string topic = config_.channel_prefix + room_id_;
    LOG_INFO("[RelayClient] subscribing " << topic << " as " << self_id_);

    connect_timer_.expires_after(std::chrono::milliseconds(config_.subscribe_timeout_ms));
    std::weak_ptr<RelayClient> weak = weak_from_this();
    connect_timer_.async_wait([weak, attempt](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->on_connect_timeout(attempt);
        }
    });

    channel_->subscribe(
        topic,
        [weak, attempt](ChannelStatus status, const std::string& detail) {
            if (auto self = weak.lock()) {
                self->on_channel_status(attempt, status, detail);
            }
        },
        [weak, attempt](const nlohmann::json& payload) {
            if (auto self = weak.lock()) {
                self->on_channel_payload(attempt, payload);
            }
        });
}

void RelayClient::on_channel_status(uint64_t attempt, ChannelStatus status, const std::string& detail) {
    if (attempt != attempt_) return;

    if (status == ChannelStatus::Subscribed) {
        if (phase_ == Phase::Connecting) {
            LOG_INFO("[RelayClient] subscribed to room " << room_id_);
            finish_connect(std::nullopt);
        }
        return;
    }

    std::string reason = std::string("relay channel ") + to_string(status);
    if (!detail.empty()) reason += ": " + detail;

    if (phase_ == Phase::Connecting) {
        LOG_ERROR("[RelayClient] " << reason);
        release_channel();
        finish_connect(Error{ErrorKind::RelayUnavailable, reason});
    } else if (phase_ == Phase::Connected) {
        // 订阅建立后断开：之后的发送都会失败，由上层决定是否重连
        LOG_WARN("[RelayClient] " << reason);
        release_channel();
        phase_ = Phase::Disconnected;
    }
}

void RelayClient::on_channel_payload(uint64_t attempt, const nlohmann::json& payload) {
    if (attempt != attempt_) return;

    auto msg = json_to_message(payload);
    if (!msg) {
        LOG_WARN("[RelayClient] dropping malformed message");
        return;
    }
    if (msg->sender_id == self_id_) {
        return;
    }
    if (msg->room_id != room_id_) {
        LOG_DEBUG("[RelayClient] dropping message for room " << msg->room_id);
        return;
    }

    // 监听可能在回调中注销自己
    std::vector<MessageHandler> handlers;
    handlers.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        handlers.push_back(entry.second);
    }
    for (const auto& handler : handlers) {
        handler(*msg);
    }
}

void RelayClient::on_connect_timeout(uint64_t attempt) {
    if (attempt != attempt_ || phase_ != Phase::Connecting) return;

    LOG_ERROR("[RelayClient] no subscription acknowledgment within "
              << config_.subscribe_timeout_ms << "ms");
    release_channel();
    finish_connect(Error{ErrorKind::RelayUnavailable,
                         std::string("relay channel ") + to_string(ChannelStatus::TimedOut)});
}

void RelayClient::finish_connect(std::optional<Error> error) {
    connect_timer_.cancel();
    phase_ = error ? Phase::Disconnected : Phase::Connected;

    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;
    auto pending = std::move(pending_sends_);
    pending_sends_.clear();

    for (auto& send : pending) {
        if (error) {
            if (send.on_done) {
                send.on_done(Error{ErrorKind::SendFailed, "relay unavailable: " + error->message});
            }
        } else {
            publish(send.message, std::move(send.on_done));
        }
    }

    if (handler) {
        handler(error);
    }

    if (disconnect_pending_) {
        complete_disconnect();
    }
}

void RelayClient::send(SignalKind kind,
                       std::optional<nlohmann::json> payload,
                       CompletionHandler on_done) {
    SignalMessage msg;
    msg.kind = kind;
    msg.payload = std::move(payload);
    msg.room_id = room_id_;
    msg.sender_id = self_id_;

    switch (phase_) {
        case Phase::Connected:
            publish(msg, std::move(on_done));
            break;
        case Phase::Connecting:
            pending_sends_.push_back(PendingSend{std::move(msg), std::move(on_done)});
            break;
        case Phase::Disconnected:
            LOG_WARN("[RelayClient] cannot send " << kind_to_string(kind) << ": not connected");
            if (on_done) {
                on_done(Error{ErrorKind::SendFailed, "relay not connected"});
            }
            break;
    }
}

void RelayClient::publish(const SignalMessage& msg, CompletionHandler on_done) {
    const std::string kind = kind_to_string(msg.kind);
    LOG_DEBUG("[RelayClient] publish " << kind);

    channel_->publish(message_to_json(msg), [kind, on_done](bool ok, const std::string& error) {
        if (ok) {
            if (on_done) on_done(std::nullopt);
            return;
        }
        LOG_WARN("[RelayClient] publish " << kind << " failed: " << error);
        if (on_done) {
            on_done(Error{ErrorKind::SendFailed, "publish " + kind + " failed: " + error});
        }
    });
}

RelayClient::Unsubscribe RelayClient::on_message(MessageHandler handler) {
    const uint64_t id = next_listener_id_++;
    listeners_[id] = std::move(handler);

    std::weak_ptr<RelayClient> weak = weak_from_this();
    return [weak, id]() {
        if (auto self = weak.lock()) {
            self->listeners_.erase(id);
        }
    };
}

void RelayClient::disconnect(std::function<void()> on_done) {
    if (on_done) {
        disconnect_handlers_.push_back(std::move(on_done));
    }

    if (phase_ != Phase::Connecting) {
        complete_disconnect();
        return;
    }

    if (disconnect_pending_) return;
    disconnect_pending_ = true;

    LOG_DEBUG("[RelayClient] waiting for in-flight connect before disconnecting");
    grace_timer_.expires_after(std::chrono::milliseconds(config_.disconnect_grace_ms));
    std::weak_ptr<RelayClient> weak = weak_from_this();
    grace_timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || !self->disconnect_pending_) return;
        if (self->phase_ == Phase::Connecting) {
            self->release_channel();
            // finish_connect 会继续完成 disconnect
            self->finish_connect(Error{ErrorKind::RelayUnavailable, "disconnected while connecting"});
        } else {
            self->complete_disconnect();
        }
    });
}

void RelayClient::release_channel() {
    ++attempt_;
    if (!channel_) return;

    auto channel = std::move(channel_);
    channel_.reset();
    try {
        channel->unsubscribe();
    } catch (const std::exception& e) {
        LOG_ERROR("[RelayClient] unsubscribe failed: " << e.what());
    }
}

void RelayClient::complete_disconnect() {
    disconnect_pending_ = false;
    grace_timer_.cancel();

    release_channel();
    phase_ = Phase::Disconnected;
    listeners_.clear();

    auto pending = std::move(pending_sends_);
    pending_sends_.clear();
    for (auto& send : pending) {
        if (send.on_done) send.on_done(Error{ErrorKind::SendFailed, "relay disconnected"});
    }

    LOG_INFO("[RelayClient] disconnected from room " << room_id_);

    auto handlers = std::move(disconnect_handlers_);
    disconnect_handlers_.clear();
    for (auto& handler : handlers) {
        handler();
    }
}

} // namespace duet::peer
