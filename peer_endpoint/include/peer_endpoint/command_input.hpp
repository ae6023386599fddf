/**
 * @file command_input.hpp
 * @brief 在 io_context 上按行读取控制命令（通常是标准输入）
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>

namespace duet::peer {

namespace net = boost::asio;

class CommandInput : public std::enable_shared_from_this<CommandInput> {
public:
    using LineFn = std::function<void(const std::string&)>;

    CommandInput(net::io_context& io_context, LineFn on_line);

    /**
     * @brief 接管文件描述符并开始读取
     *
     * 描述符由本对象关闭（包括失败时）。不可轮询的描述符（普通文件）返回 false。
     */
    bool open(int fd);

    /**
     * @brief 停止读取，之后不再回调
     */
    void cancel();

    bool active() const { return active_; }

private:
    void do_read();
    void on_read(const boost::system::error_code& ec, std::size_t bytes);
    void deliver_line(std::size_t bytes);

    net::posix::stream_descriptor input_;
    net::streambuf buffer_;
    LineFn on_line_;
    bool active_ = false;
};

} // namespace duet::peer
