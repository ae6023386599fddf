#include "peer_endpoint/local_media.hpp"

namespace duet::peer {

LocalMedia::LocalMedia(std::vector<MediaTrack> tracks)
    : tracks_(std::move(tracks)) {}

std::shared_ptr<LocalMedia> LocalMedia::from_config(const MediaConfig& config) {
    std::vector<MediaTrack> tracks;
    if (config.audio) {
        tracks.push_back(MediaTrack{"audio", "audio", true});
    }
    if (config.video) {
        tracks.push_back(MediaTrack{"video", "video", true});
    }
    if (tracks.empty()) {
        return nullptr;
    }
    return std::make_shared<LocalMedia>(std::move(tracks));
}

bool LocalMedia::has_track(const std::string& kind) const {
    for (const auto& track : tracks_) {
        if (track.kind == kind) return true;
    }
    return false;
}

std::optional<bool> LocalMedia::toggle(const std::string& kind) {
    for (auto& track : tracks_) {
        if (track.kind == kind) {
            track.enabled = !track.enabled;
            return track.enabled;
        }
    }
    return std::nullopt;
}

// ==================== MediaReadiness ====================

MediaReadiness::MediaReadiness(net::io_context& io_context)
    : timer_(io_context) {}

void MediaReadiness::wait(std::chrono::milliseconds timeout, Handler handler) {
    cancel();
    handler_ = std::move(handler);
    const uint64_t id = ++wait_id_;

    if (ready_) {
        resolve(true);
        return;
    }

    timer_.expires_after(timeout);
    timer_.async_wait([this, id](const boost::system::error_code& ec) {
        if (ec || id != wait_id_) {
            return;
        }
        resolve(false);
    });
}

void MediaReadiness::notify_ready() {
    ready_ = true;
    if (handler_) {
        resolve(true);
    }
}

void MediaReadiness::cancel() {
    ++wait_id_;
    handler_ = nullptr;
    timer_.cancel();
}

void MediaReadiness::resolve(bool ready) {
    if (!handler_) {
        return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    ++wait_id_;
    timer_.cancel();
    handler(ready);
}

} // namespace duet::peer
