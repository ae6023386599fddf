/**
 * @file local_media.hpp
 * @brief 本地/远端媒体句柄与媒体就绪等待
 *
 * 采集与渲染由外部完成，这里只描述轨道及其启用状态
 */

#pragma once

#include "peer_endpoint/config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace duet::peer {

namespace net = boost::asio;

struct MediaTrack {
    std::string kind;  // "audio" | "video"
    std::string mid;
    bool enabled = true;
};

/**
 * @brief 本地媒体流（一组轨道）
 */
class LocalMedia {
public:
    explicit LocalMedia(std::vector<MediaTrack> tracks);

    /**
     * @brief 按配置描述本地媒体，音视频均未启用时返回 nullptr
     */
    static std::shared_ptr<LocalMedia> from_config(const MediaConfig& config);

    const std::vector<MediaTrack>& tracks() const { return tracks_; }

    bool has_track(const std::string& kind) const;

    /**
     * @brief 切换某类轨道的启用状态
     * @return 切换后的状态；不存在该类轨道时返回 std::nullopt
     */
    std::optional<bool> toggle(const std::string& kind);

private:
    std::vector<MediaTrack> tracks_;
};

struct RemoteTrack {
    std::string kind;
    std::string mid;
};

/**
 * @brief 远端媒体句柄，仅在会话 Connected 时对外可见
 */
struct RemoteMedia {
    std::vector<RemoteTrack> tracks;
};

/**
 * @brief 媒体就绪等待
 *
 * wait() 的回调只触发一次：媒体就绪时参数为 true，超时为 false。
 * 所有调用都须在同一 io_context 线程上进行。
 */
class MediaReadiness {
public:
    using Handler = std::function<void(bool ready)>;

    explicit MediaReadiness(net::io_context& io_context);

    void wait(std::chrono::milliseconds timeout, Handler handler);

    void notify_ready();

    void reset() { ready_ = false; }

    /**
     * @brief 放弃当前等待，回调不再触发
     */
    void cancel();

    bool ready() const { return ready_; }
    bool waiting() const { return static_cast<bool>(handler_); }

private:
    void resolve(bool ready);

    net::steady_timer timer_;
    Handler handler_;
    uint64_t wait_id_ = 0;
    bool ready_ = false;
};

} // namespace duet::peer
