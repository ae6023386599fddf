/**
 * @file websocket_relay_channel.hpp
 * @brief 通过 WebSocket 连接中继服务器的 RelayChannel
 */

#pragma once

#include "peer_endpoint/relay_channel.hpp"

#include "duet/relay_protocol.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace duet::peer {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief ws://host:port/path 形式的地址
 */
struct RelayEndpoint {
    std::string host;
    std::string port;
    std::string path;
};

/**
 * @brief 解析中继地址，仅支持 ws://
 */
std::optional<RelayEndpoint> parse_relay_url(const std::string& url);

/**
 * @brief WebSocket 中继通道
 *
 * 只在 io_context 线程上使用，写队列无需加锁
 */
class WebSocketRelayChannel : public RelayChannel,
                              public std::enable_shared_from_this<WebSocketRelayChannel> {
public:
    WebSocketRelayChannel(net::io_context& io_context, std::string url);
    ~WebSocketRelayChannel() override;

    void subscribe(const std::string& topic,
                   StatusHandler on_status,
                   PayloadHandler on_payload) override;

    void publish(const nlohmann::json& payload, PublishHandler on_done) override;

    void unsubscribe() override;

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint);
    void on_handshake(beast::error_code ec);

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void handle_frame(const protocol::RelayFrame& frame);

    void send_frame(const protocol::RelayFrame& frame);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    /**
     * @brief 连接失败或断开：通知状态并让未完成的发布全部失败
     */
    void fail(const std::string& what, beast::error_code ec);
    void fail_pending_publishes(const std::string& error);

    net::io_context& io_context_;
    std::string url_;
    RelayEndpoint endpoint_;
    std::string topic_;

    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer read_buffer_;

    std::deque<std::string> write_queue_;
    bool writing_ = false;
    bool close_after_write_ = false;

    StatusHandler on_status_;
    PayloadHandler on_payload_;
    std::map<int64_t, PublishHandler> pending_publishes_;
    int64_t next_ref_ = 1;

    bool open_ = false;        // 握手完成
    bool subscribed_ = false;  // 已收到 SUBSCRIBED
    bool closing_ = false;
};

} // namespace duet::peer
