#include "peer_endpoint/command_input.hpp"

#include "duet/logger.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read_until.hpp>

#include <string>

#include <unistd.h>

namespace duet::peer {

CommandInput::CommandInput(net::io_context& io_context, LineFn on_line)
    : input_(io_context)
    , on_line_(std::move(on_line)) {}

bool CommandInput::open(int fd) {
    boost::system::error_code ec;
    input_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        LOG_WARN("[CommandInput] cannot read commands: " << ec.message());
        return false;
    }

    active_ = true;
    do_read();
    return true;
}

void CommandInput::cancel() {
    if (!active_) {
        return;
    }
    active_ = false;

    boost::system::error_code ec;
    input_.cancel(ec);
    input_.close(ec);
}

void CommandInput::do_read() {
    net::async_read_until(
        input_, buffer_, '\n',
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

void CommandInput::on_read(const boost::system::error_code& ec, std::size_t bytes) {
    if (!active_) {
        return;
    }

    if (ec == net::error::eof) {
        // 最后一行可能没有换行符
        if (buffer_.size() > 0) {
            deliver_line(buffer_.size());
        }
        LOG_DEBUG("[CommandInput] end of input");
        active_ = false;
        return;
    }
    if (ec) {
        if (ec != net::error::operation_aborted) {
            LOG_WARN("[CommandInput] read error: " << ec.message());
        }
        active_ = false;
        return;
    }

    deliver_line(bytes);

    // 回调内可能已调用 cancel
    if (active_) {
        do_read();
    }
}

void CommandInput::deliver_line(std::size_t bytes) {
    std::string line(net::buffers_begin(buffer_.data()),
                     net::buffers_begin(buffer_.data()) + bytes);
    buffer_.consume(bytes);

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    on_line_(line);
}

} // namespace duet::peer
