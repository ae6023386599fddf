#include "peer_endpoint/presence_announcer.hpp"

#include "duet/logger.hpp"

#include <chrono>

namespace duet::peer {

PresenceAnnouncer::PresenceAnnouncer(net::io_context& io_context,
                                     const PresenceConfig& config,
                                     AnnounceFn announce,
                                     PredicateFn should_continue)
    : timer_(io_context)
    , config_(config)
    , announce_(std::move(announce))
    , should_continue_(std::move(should_continue)) {}

PresenceAnnouncer::~PresenceAnnouncer() {
    cancel();
}

void PresenceAnnouncer::start() {
    cancel();

    active_ = true;
    announcements_ = 1;
    announce_();

    // announce_ 内部可能已经触发了 cancel
    if (active_) {
        schedule();
    }
}

void PresenceAnnouncer::cancel() {
    ++round_;
    active_ = false;
    timer_.cancel();
}

void PresenceAnnouncer::schedule() {
    const uint64_t round = round_;
    timer_.expires_after(std::chrono::milliseconds(config_.interval_ms));
    timer_.async_wait([this, round](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        on_timer(round);
    });
}

void PresenceAnnouncer::on_timer(uint64_t round) {
    if (round != round_ || !active_) {
        return;
    }

    if (!should_continue_()) {
        LOG_DEBUG("[PresenceAnnouncer] negotiation in progress, stop announcing");
        active_ = false;
        return;
    }

    if (announcements_ > config_.max_retries) {
        active_ = false;
        LOG_INFO("[PresenceAnnouncer] no counterpart after " << announcements_
                 << " announcements, keep waiting");
        if (on_exhausted_) {
            on_exhausted_();
        }
        return;
    }

    ++announcements_;
    LOG_DEBUG("[PresenceAnnouncer] re-announcing presence (" << announcements_ - 1
              << "/" << config_.max_retries << ")");
    announce_();

    if (active_) {
        schedule();
    }
}

} // namespace duet::peer
