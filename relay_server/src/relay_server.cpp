/**
 * @file relay_server.cpp
 * @brief 中继服务器实现
 */

#include "relay_server/relay_server.hpp"

#include "duet/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace duet::relay {

// ==================== RelaySession ====================

std::string RelaySession::generate_session_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 8; ++i) {
        ss << std::setw(2) << dis(gen);
    }

    return ss.str();
}

RelaySession::RelaySession(tcp::socket&& socket, RelayServer& server)
    : ws_(std::move(socket))
    , server_(server)
    , session_id_(generate_session_id())
{
    ws_.binary(false);  // JSON 文本模式
    ws_.read_message_max(server_.config().max_message_bytes);

    beast::websocket::stream_base::timeout opt{
        std::chrono::seconds(30),   // 握手超时
        std::chrono::seconds(300),  // 空闲超时
        true                        // 启用 ping/pong 心跳
    };
    ws_.set_option(opt);
}

void RelaySession::start() {
    server_.add_session(session_id_, shared_from_this());
    do_accept();
}

void RelaySession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->ws_.close(websocket::close_code::normal, ec);
        self->finish();
    });
}

void RelaySession::send(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(message);
    }

    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        std::lock_guard<std::mutex> lock(self->write_mutex_);
        if (!self->writing_ && !self->write_queue_.empty()) {
            self->writing_ = true;
            self->do_write();
        }
    });
}

void RelaySession::do_accept() {
    ws_.async_accept(
        beast::bind_front_handler(&RelaySession::on_accept, shared_from_this())
    );
}

void RelaySession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("[RelaySession] accept error: " << ec.message());
        finish();
        return;
    }

    LOG_INFO("[RelaySession] connection established: " << session_id_);
    do_read();
}

void RelaySession::do_read() {
    ws_.async_read(
        read_buffer_,
        beast::bind_front_handler(&RelaySession::on_read, shared_from_this())
    );
}

void RelaySession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == websocket::error::closed) {
        LOG_INFO("[RelaySession] connection closed: " << session_id_);
        finish();
        return;
    }

    if (ec) {
        LOG_WARN("[RelaySession] read error: " << ec.message());
        finish();
        return;
    }

    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(bytes);

    handle_frame(text);
    do_read();
}

void RelaySession::do_write() {
    // 调用方持有 write_mutex_
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    auto& message = write_queue_.front();

    ws_.async_write(
        net::buffer(message),
        beast::bind_front_handler(&RelaySession::on_write, shared_from_this())
    );
}

void RelaySession::on_write(beast::error_code ec, std::size_t /*bytes*/) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (ec) {
        LOG_WARN("[RelaySession] write error: " << ec.message());
        std::queue<std::string>().swap(write_queue_);
        writing_ = false;
        return;
    }

    write_queue_.pop();
    do_write();
}

void RelaySession::handle_frame(const std::string& text) {
    auto frame = protocol::decode_frame(text);
    if (!frame) {
        LOG_WARN("[RelaySession] malformed frame from " << session_id_);
        return;
    }

    if (frame->op == protocol::kOpSubscribe) {
        handle_subscribe(*frame);
    } else if (frame->op == protocol::kOpPublish) {
        handle_publish(*frame);
    } else if (frame->op == protocol::kOpUnsubscribe) {
        handle_unsubscribe(*frame);
    } else {
        LOG_WARN("[RelaySession] unknown op: " << frame->op);
    }
}

void RelaySession::handle_subscribe(const protocol::RelayFrame& frame) {
    if (frame.topic.empty()) {
        send(protocol::encode_frame(
            protocol::make_status(frame.topic, protocol::kStatusChannelError, "missing topic")));
        return;
    }

    topics_.insert(frame.topic);
    server_.registry().subscribe(frame.topic, shared_from_this());
    LOG_INFO("[RelaySession] " << session_id_ << " subscribed " << frame.topic
             << " (" << server_.registry().subscriber_count(frame.topic) << " subscribers)");

    send(protocol::encode_frame(protocol::make_status(frame.topic, protocol::kStatusSubscribed)));
}

void RelaySession::handle_publish(const protocol::RelayFrame& frame) {
    if (!topics_.count(frame.topic)) {
        send(protocol::encode_frame(protocol::make_ack(frame.ref, false, "not subscribed")));
        return;
    }

    const std::string event = frame.event.empty() ? protocol::kSignalEvent : frame.event;
    auto delivered = server_.registry().publish(
        frame.topic, session_id_,
        protocol::encode_frame(protocol::make_broadcast(frame.topic, event, frame.payload)));

    LOG_DEBUG("[RelaySession] " << session_id_ << " published to " << frame.topic
              << " (" << delivered << " receivers)");

    send(protocol::encode_frame(protocol::make_ack(frame.ref, true)));
}

void RelaySession::handle_unsubscribe(const protocol::RelayFrame& frame) {
    topics_.erase(frame.topic);
    server_.registry().unsubscribe(frame.topic, session_id_);
    LOG_INFO("[RelaySession] " << session_id_ << " unsubscribed " << frame.topic);
}

void RelaySession::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    server_.registry().remove(session_id_);
    topics_.clear();
    server_.remove_session(session_id_);
}

// ==================== RelayServer ====================

RelayServer::RelayServer(net::io_context& io_context, const Config& config)
    : io_context_(io_context)
    , acceptor_(io_context)
    , config_(config)
{
}

RelayServer::~RelayServer() {
    stop();
}

void RelayServer::start() {
    beast::error_code ec;

    auto address = net::ip::make_address(config_.server.host, ec);
    if (ec) {
        LOG_ERROR("Invalid address: " << ec.message());
        return;
    }

    tcp::endpoint endpoint{address, config_.server.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        LOG_ERROR("Failed to open acceptor: " << ec.message());
        return;
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        LOG_ERROR("Failed to bind: " << ec.message());
        return;
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("Failed to listen: " << ec.message());
        return;
    }

    running_ = true;
    LOG_INFO("Relay server listening on " << config_.server.host << ":" << config_.server.port);

    do_accept();
}

void RelayServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    beast::error_code ec;
    acceptor_.close(ec);

    std::vector<std::shared_ptr<RelaySession>> sessions_copy;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_copy.reserve(sessions_.size());
        for (auto& [id, session] : sessions_) {
            sessions_copy.push_back(session);
        }
    }
    for (auto& session : sessions_copy) {
        session->close();
    }
}

void RelayServer::add_session(const std::string& id, std::shared_ptr<RelaySession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[id] = std::move(session);
}

void RelayServer::remove_session(const std::string& id) {
    std::shared_ptr<RelaySession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        // 在锁外释放，避免析构时重入
        session = std::move(it->second);
        sessions_.erase(it);
    }
}

size_t RelayServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

uint16_t RelayServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void RelayServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(io_context_),
        beast::bind_front_handler(&RelayServer::on_accept, this)
    );
}

void RelayServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            LOG_WARN("Accept error: " << ec.message());
        }
    } else if (connection_count() >= config_.server.max_connections) {
        LOG_WARN("Connection limit reached (" << config_.server.max_connections
                 << "), rejecting client");
        beast::error_code close_ec;
        socket.close(close_ec);
    } else {
        std::make_shared<RelaySession>(std::move(socket), *this)->start();
    }

    if (running_) {
        do_accept();
    }
}

} // namespace duet::relay
