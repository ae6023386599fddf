/**
 * @file presence_announcer.hpp
 * @brief 在场广播：进入等待状态后重复发送 Join
 *
 * 对端可能尚未订阅中继频道，第一次 Join 会被静默丢弃，
 * 因此按固定间隔重发，直到开始协商或达到次数上限。
 */

#pragma once

#include "peer_endpoint/config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>

namespace duet::peer {

namespace net = boost::asio;

class PresenceAnnouncer {
public:
    using AnnounceFn = std::function<void()>;
    using PredicateFn = std::function<bool()>;
    using ExhaustedFn = std::function<void()>;

    /**
     * @param announce 发送一次 Join
     * @param should_continue 返回 false 时停止重发（已在协商或已连接）
     */
    PresenceAnnouncer(net::io_context& io_context,
                      const PresenceConfig& config,
                      AnnounceFn announce,
                      PredicateFn should_continue);

    ~PresenceAnnouncer();

    /**
     * @brief 立即发送一次，随后按间隔重发（重新开始计数）
     */
    void start();

    /**
     * @brief 立即停止，本轮不再重发
     */
    void cancel();

    void set_on_exhausted(ExhaustedFn fn) { on_exhausted_ = std::move(fn); }

    bool active() const { return active_; }

    // 本轮已发送的 Join 数（含首次）
    int announcements() const { return announcements_; }

private:
    void schedule();
    void on_timer(uint64_t round);

    net::steady_timer timer_;
    PresenceConfig config_;
    AnnounceFn announce_;
    PredicateFn should_continue_;
    ExhaustedFn on_exhausted_;

    uint64_t round_ = 0;
    int announcements_ = 0;
    bool active_ = false;
};

} // namespace duet::peer
