/**
 * @file websocket_relay_channel.cpp
 * @brief WebSocket 中继通道实现
 */

#include "peer_endpoint/websocket_relay_channel.hpp"

#include "duet/logger.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

namespace duet::peer {

std::optional<RelayEndpoint> parse_relay_url(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    RelayEndpoint endpoint;

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    endpoint.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = authority;
        endpoint.port = "80";
    } else {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
    }

    if (endpoint.host.empty() || endpoint.port.empty()) {
        return std::nullopt;
    }
    return endpoint;
}

WebSocketRelayChannel::WebSocketRelayChannel(net::io_context& io_context, std::string url)
    : io_context_(io_context)
    , url_(std::move(url))
    , resolver_(io_context)
    , ws_(io_context) {}

WebSocketRelayChannel::~WebSocketRelayChannel() {
    beast::get_lowest_layer(ws_).close();
}

void WebSocketRelayChannel::subscribe(const std::string& topic,
                                      StatusHandler on_status,
                                      PayloadHandler on_payload) {
    topic_ = topic;
    on_status_ = std::move(on_status);
    on_payload_ = std::move(on_payload);

    auto endpoint = parse_relay_url(url_);
    if (!endpoint) {
        LOG_ERROR("[RelayChannel] unsupported relay url: " << url_);
        net::post(io_context_, [self = shared_from_this()]() {
            if (self->closing_ || !self->on_status_) return;
            self->on_status_(ChannelStatus::ChannelError, "unsupported relay url");
        });
        return;
    }
    endpoint_ = *endpoint;

    LOG_DEBUG("[RelayChannel] connecting to " << endpoint_.host << ":" << endpoint_.port
              << endpoint_.path << " topic=" << topic_);

    resolver_.async_resolve(
        endpoint_.host, endpoint_.port,
        beast::bind_front_handler(&WebSocketRelayChannel::on_resolve, shared_from_this()));
}

void WebSocketRelayChannel::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (closing_) return;
    if (ec) {
        return fail("resolve", ec);
    }

    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(10));
    beast::get_lowest_layer(ws_).async_connect(
        results,
        beast::bind_front_handler(&WebSocketRelayChannel::on_connect, shared_from_this()));
}

void WebSocketRelayChannel::on_connect(beast::error_code ec,
                                       tcp::resolver::results_type::endpoint_type endpoint) {
    if (closing_) return;
    if (ec) {
        return fail("connect", ec);
    }

    // 握手由 websocket 自身的超时管理
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

    std::string host = endpoint_.host + ":" + std::to_string(endpoint.port());
    ws_.async_handshake(
        host, endpoint_.path,
        beast::bind_front_handler(&WebSocketRelayChannel::on_handshake, shared_from_this()));
}

void WebSocketRelayChannel::on_handshake(beast::error_code ec) {
    if (closing_) return;
    if (ec) {
        return fail("handshake", ec);
    }

    open_ = true;
    ws_.text(true);

    send_frame(protocol::make_subscribe(topic_));
    do_read();
}

void WebSocketRelayChannel::publish(const nlohmann::json& payload, PublishHandler on_done) {
    if (!open_ || !subscribed_ || closing_) {
        if (on_done) {
            net::post(io_context_, [on_done]() { on_done(false, "channel not subscribed"); });
        }
        return;
    }

    const int64_t ref = next_ref_++;
    if (on_done) {
        pending_publishes_[ref] = std::move(on_done);
    }
    send_frame(protocol::make_publish(topic_, payload, ref));
}

void WebSocketRelayChannel::unsubscribe() {
    if (closing_) return;
    closing_ = true;

    on_status_ = nullptr;
    on_payload_ = nullptr;
    pending_publishes_.clear();

    resolver_.cancel();

    if (open_) {
        send_frame(protocol::make_unsubscribe(topic_));
        close_after_write_ = true;
    } else {
        beast::get_lowest_layer(ws_).close();
    }
}

void WebSocketRelayChannel::do_read() {
    ws_.async_read(
        read_buffer_,
        beast::bind_front_handler(&WebSocketRelayChannel::on_read, shared_from_this()));
}

void WebSocketRelayChannel::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (closing_) return;

    if (ec == websocket::error::closed) {
        LOG_INFO("[RelayChannel] relay closed the connection");
        return fail("read", ec);
    }
    if (ec) {
        return fail("read", ec);
    }

    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(bytes_transferred);

    auto frame = protocol::decode_frame(text);
    if (!frame) {
        LOG_WARN("[RelayChannel] dropping malformed frame");
    } else {
        handle_frame(*frame);
    }

    // 回调里可能已经 unsubscribe
    if (!closing_) {
        do_read();
    }
}

void WebSocketRelayChannel::handle_frame(const protocol::RelayFrame& frame) {
    if (frame.op == protocol::kOpStatus) {
        if (frame.topic != topic_) return;
        if (frame.status == protocol::kStatusSubscribed) {
            subscribed_ = true;
            if (on_status_) on_status_(ChannelStatus::Subscribed, frame.detail);
        } else {
            subscribed_ = false;
            LOG_WARN("[RelayChannel] status " << frame.status << ": " << frame.detail);
            if (on_status_) on_status_(ChannelStatus::ChannelError, frame.detail);
        }
    } else if (frame.op == protocol::kOpBroadcast) {
        if (frame.topic != topic_ || frame.event != protocol::kSignalEvent) return;
        if (on_payload_) on_payload_(frame.payload);
    } else if (frame.op == protocol::kOpAck) {
        auto it = pending_publishes_.find(frame.ref);
        if (it == pending_publishes_.end()) return;
        auto handler = std::move(it->second);
        pending_publishes_.erase(it);
        handler(frame.ok, frame.detail);
    } else {
        LOG_DEBUG("[RelayChannel] ignoring op: " << frame.op);
    }
}

void WebSocketRelayChannel::send_frame(const protocol::RelayFrame& frame) {
    write_queue_.push_back(protocol::encode_frame(frame));
    if (!writing_) {
        writing_ = true;
        do_write();
    }
}

void WebSocketRelayChannel::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        if (close_after_write_ && open_) {
            open_ = false;
            ws_.async_close(websocket::close_code::normal,
                            [self = shared_from_this()](beast::error_code ec) {
                                if (ec) {
                                    LOG_DEBUG("[RelayChannel] close: " << ec.message());
                                }
                            });
        }
        return;
    }

    ws_.async_write(
        net::buffer(write_queue_.front()),
        beast::bind_front_handler(&WebSocketRelayChannel::on_write, shared_from_this()));
}

void WebSocketRelayChannel::on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        write_queue_.clear();
        writing_ = false;
        if (!closing_) {
            fail("write", ec);
        }
        return;
    }

    write_queue_.pop_front();
    do_write();
}

void WebSocketRelayChannel::fail(const std::string& what, beast::error_code ec) {
    const bool was_subscribed = subscribed_;
    open_ = false;
    subscribed_ = false;

    const std::string detail = what + ": " + ec.message();
    LOG_WARN("[RelayChannel] " << detail);

    fail_pending_publishes(detail);

    auto on_status = on_status_;
    if (on_status) {
        on_status(was_subscribed ? ChannelStatus::Closed : ChannelStatus::ChannelError, detail);
    }
}

void WebSocketRelayChannel::fail_pending_publishes(const std::string& error) {
    auto pending = std::move(pending_publishes_);
    pending_publishes_.clear();
    for (auto& entry : pending) {
        entry.second(false, error);
    }
}

} // namespace duet::peer
