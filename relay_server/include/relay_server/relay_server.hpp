/**
 * @file relay_server.hpp
 * @brief WebSocket 发布/订阅中继服务器
 *
 * 只转发房间内的信令，不解析也不保存消息内容
 */

#pragma once

#include "relay_server/config.hpp"
#include "relay_server/topic_registry.hpp"

#include "duet/relay_protocol.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>

namespace duet::relay {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class RelayServer;

/**
 * @brief 中继会话（一个客户端连接）
 */
class RelaySession : public Subscriber,
                     public std::enable_shared_from_this<RelaySession> {
public:
    RelaySession(tcp::socket&& socket, RelayServer& server);
    ~RelaySession() override = default;

    void start();
    void close();
    void send(const std::string& message);

    const std::string& subscriber_id() const override { return session_id_; }
    void deliver(const std::string& frame) override { send(frame); }

private:
    void do_accept();
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);

    void handle_frame(const std::string& text);
    void handle_subscribe(const protocol::RelayFrame& frame);
    void handle_publish(const protocol::RelayFrame& frame);
    void handle_unsubscribe(const protocol::RelayFrame& frame);

    /**
     * @brief 连接结束：退出所有 topic 并从服务器注销
     */
    void finish();

    static std::string generate_session_id();

    websocket::stream<beast::tcp_stream> ws_;
    RelayServer& server_;
    std::string session_id_;

    beast::flat_buffer read_buffer_;
    std::queue<std::string> write_queue_;
    std::mutex write_mutex_;
    bool writing_ = false;

    std::set<std::string> topics_;
    std::atomic<bool> finished_{false};
};

/**
 * @brief 中继服务器
 */
class RelayServer {
public:
    RelayServer(net::io_context& io_context, const Config& config);
    ~RelayServer();

    void start();
    void stop();

    void add_session(const std::string& id, std::shared_ptr<RelaySession> session);
    void remove_session(const std::string& id);

    size_t connection_count() const;

    // 实际监听端口（配置为 0 时由系统分配）
    uint16_t port() const;

    TopicRegistry& registry() { return registry_; }
    const ServerConfig& config() const { return config_.server; }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    Config config_;

    TopicRegistry registry_;

    std::unordered_map<std::string, std::shared_ptr<RelaySession>> sessions_;
    mutable std::mutex sessions_mutex_;

    std::atomic<bool> running_{false};
};

} // namespace duet::relay
