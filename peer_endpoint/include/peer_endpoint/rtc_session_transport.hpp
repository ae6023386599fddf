/**
 * @file rtc_session_transport.hpp
 * @brief 基于 libdatachannel 的会话传输
 */

#pragma once

#include "peer_endpoint/config.hpp"
#include "peer_endpoint/session_transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace rtc {
class PeerConnection;
class Track;
}

namespace duet::peer {

class RtcSessionTransport : public SessionTransport {
public:
    RtcSessionTransport(const WebRtcConfig& config, Callbacks callbacks);
    ~RtcSessionTransport() override;

    SignalingState signaling_state() const override;
    TransportState connection_state() const override;

    SessionDescription create_offer() override;
    SessionDescription create_answer() override;
    void rollback() override;
    void set_remote_description(const SessionDescription& desc) override;
    void add_remote_candidate(const IceCandidate& candidate) override;
    void attach_local_media(const LocalMedia& media) override;
    void close() override;

private:
    /**
     * @brief libdatachannel 回调线程与本对象之间的共享状态
     *
     * 回调持有其副本，close 后不再向上转发
     */
    struct Hooks {
        std::mutex mutex;
        Callbacks callbacks;
        bool active = true;
    };

    SessionDescription create_local(bool offer);

    std::shared_ptr<Hooks> hooks_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::unordered_map<std::string, std::shared_ptr<rtc::Track>> local_tracks_;
    std::atomic<bool> closed_{false};
};

/**
 * @brief 按配置创建 RtcSessionTransport
 */
class RtcTransportFactory : public TransportFactory {
public:
    explicit RtcTransportFactory(const WebRtcConfig& config)
        : config_(config) {}

    std::unique_ptr<SessionTransport> create(SessionTransport::Callbacks callbacks) override;

private:
    WebRtcConfig config_;
};

} // namespace duet::peer
