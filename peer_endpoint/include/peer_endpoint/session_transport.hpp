/**
 * @file session_transport.hpp
 * @brief 会话传输抽象（一次协商尝试及其建立的直连通道）
 */

#pragma once

#include "peer_endpoint/local_media.hpp"
#include "peer_endpoint/signal_message.hpp"

#include <functional>
#include <memory>

namespace duet::peer {

/**
 * @brief 连接状态
 */
enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

/**
 * @brief 信令状态（offer/answer 子状态）
 */
enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    HaveLocalPranswer,
    HaveRemotePranswer
};

const char* to_string(TransportState state);
const char* to_string(SignalingState state);

/**
 * @brief 会话传输
 *
 * 失败的操作抛出 SessionError。回调可能在任意线程触发，
 * 由使用方负责切回自己的事件循环。
 */
class SessionTransport {
public:
    using CandidateCallback = std::function<void(const IceCandidate& candidate)>;
    using StateCallback = std::function<void(TransportState state)>;
    using TrackCallback = std::function<void(const RemoteTrack& track)>;

    struct Callbacks {
        CandidateCallback on_local_candidate;
        StateCallback on_state;
        TrackCallback on_remote_track;
    };

    virtual ~SessionTransport() = default;

    virtual SignalingState signaling_state() const = 0;
    virtual TransportState connection_state() const = 0;

    /**
     * @brief 创建 Offer 并设为本地描述
     */
    virtual SessionDescription create_offer() = 0;

    /**
     * @brief 创建 Answer 并设为本地描述（须已有远端 Offer）
     */
    virtual SessionDescription create_answer() = 0;

    /**
     * @brief 撤销本地尚未完成的 Offer，回到 Stable
     */
    virtual void rollback() = 0;

    virtual void set_remote_description(const SessionDescription& desc) = 0;

    virtual void add_remote_candidate(const IceCandidate& candidate) = 0;

    /**
     * @brief 绑定本地媒体轨道，可多次调用（媒体句柄变化时重新绑定）
     */
    virtual void attach_local_media(const LocalMedia& media) = 0;

    virtual void close() = 0;
};

/**
 * @brief 传输工厂，每次调用得到一个全新实例
 */
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual std::unique_ptr<SessionTransport> create(SessionTransport::Callbacks callbacks) = 0;
};

} // namespace duet::peer
