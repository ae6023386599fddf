/**
 * @file session_coordinator.hpp
 * @brief 会话协调器（协商状态机）
 *
 * 唯一拥有 SessionTransport，消费中继消息与传输回调，
 * 驱动 Idle -> AwaitingCounterpart -> Negotiating -> Connected 状态机，
 * 并把会话状态暴露给展示层。
 */

#pragma once

#include "peer_endpoint/candidate_queue.hpp"
#include "peer_endpoint/config.hpp"
#include "peer_endpoint/errors.hpp"
#include "peer_endpoint/local_media.hpp"
#include "peer_endpoint/presence_announcer.hpp"
#include "peer_endpoint/relay_client.hpp"
#include "peer_endpoint/role_resolver.hpp"
#include "peer_endpoint/session_status.hpp"
#include "peer_endpoint/session_transport.hpp"
#include "peer_endpoint/signal_message.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace duet::peer {

namespace net = boost::asio;

/**
 * @brief 会话协调器
 *
 * 中继消息、传输状态变化、本地 candidate 都作为事件进入同一个 FIFO 队列，
 * 在 io_context 线程上逐个处理。Leader 等待本地媒体时队列暂停，
 * 期间到达的事件在恢复后按顺序处理。
 *
 * 必须通过 std::make_shared 创建。
 */
class SessionCoordinator : public std::enable_shared_from_this<SessionCoordinator> {
public:
    using StatusCallback = std::function<void(const SessionStatus& status)>;
    using StateCallback = std::function<void(SessionState state)>;
    using RemoteMediaCallback = std::function<void(const std::optional<RemoteMedia>& media)>;
    using ExitCallback = std::function<void(ExitReason reason)>;

    SessionCoordinator(net::io_context& io_context,
                       std::shared_ptr<RelayClient> relay,
                       std::shared_ptr<TransportFactory> transport_factory,
                       const Config& config);

    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /**
     * @brief 加入房间：订阅中继频道，成功后进入 AwaitingCounterpart
     *
     * 中继不可用时进入 Failed 并在状态中给出错误，可以再次调用
     */
    void start(const std::string& room_id);

    /**
     * @brief 退出房间：尽力发送 Leave，关闭传输，释放订阅
     */
    void shutdown();

    // ==================== 媒体 ====================

    /**
     * @brief 本地媒体句柄变化，轨道绑定到当前传输并结束媒体等待
     */
    void set_local_media(std::shared_ptr<LocalMedia> media);

    void report_media_unavailable(const std::string& reason);

    // ==================== 展示层命令 ====================

    /**
     * @return 切换后的启用状态，没有本地音频时为 false
     */
    bool toggle_local_audio();
    bool toggle_local_video();

    /**
     * @brief 请求对端退出房间（发送 Kick）
     */
    void force_remove_peer();

    void set_status_callback(StatusCallback cb) { status_callback_ = std::move(cb); }
    void set_state_callback(StateCallback cb) { state_callback_ = std::move(cb); }
    void set_remote_media_callback(RemoteMediaCallback cb) { remote_media_callback_ = std::move(cb); }
    void set_exit_callback(ExitCallback cb) { exit_callback_ = std::move(cb); }

    // ==================== 查询 ====================

    SessionState state() const { return s_.state; }
    const SessionStatus& status() const { return status_; }
    std::optional<NegotiationRole> role() const { return s_.role; }
    const std::string& counterpart_id() const { return s_.counterpart_id; }
    const std::string& self_id() const { return relay_->self_id(); }
    const std::string& room_id() const { return room_id_; }

    /**
     * @brief 远端媒体，仅在 Connected 时存在
     */
    std::optional<RemoteMedia> remote_media() const;

    std::size_t pending_candidate_count() const { return s_.candidates.size(); }
    bool has_remote_description() const { return s_.remote_description_set; }
    bool has_transport() const { return static_cast<bool>(transport_); }

    // 每次创建新传输递增
    uint64_t transport_generation() const { return generation_; }

private:
    /**
     * @brief 协商状态，只由事件循环修改
     */
    struct NegotiationState {
        SessionState state = SessionState::Idle;
        std::optional<NegotiationRole> role;
        std::string counterpart_id;
        bool remote_description_set = false;
        CandidateQueue candidates;
        std::set<std::pair<std::string, std::string>> processed_joins;  // (senderId, roomId)
    };

    struct Event {
        enum class Type {
            Signal,
            TransportState,
            LocalCandidate,
            RemoteTrack
        };

        Type type = Type::Signal;
        uint64_t generation = 0;
        SignalMessage message;
        TransportState transport_state = TransportState::New;
        IceCandidate candidate;
        RemoteTrack track;
    };

    // ==================== 事件队列 ====================

    void enqueue(Event event);
    void process_events();
    void dispatch(const Event& event);

    // ==================== 信令处理 ====================

    void handle_join(const SignalMessage& msg);
    void handle_offer(const SignalMessage& msg);
    void handle_answer(const SignalMessage& msg);
    void handle_candidate(const SignalMessage& msg);
    void handle_leave(const SignalMessage& msg);
    void handle_kick(const SignalMessage& msg);

    // ==================== 传输事件 ====================

    void handle_transport_state(TransportState state);
    void handle_local_candidate(const IceCandidate& candidate);
    void handle_remote_track(const RemoteTrack& track);

    // ==================== 内部流程 ====================

    void on_relay_connected(const std::optional<Error>& error);

    /**
     * @brief 丢弃旧传输，创建新传输，开始在场广播
     */
    void enter_awaiting_counterpart();

    /**
     * @brief 发现对端并进入 Negotiating
     */
    void begin_negotiation(const std::string& peer_id);

    /**
     * @brief Leader 等待本地媒体（最多 media_wait_ms）后发送 Offer
     *
     * 等待期间事件队列暂停，其间到达的 Kick / Leave 最多延迟 media_wait_ms 才处理
     */
    void wait_for_media_then_offer();
    void resume_after_media_wait(uint64_t generation, bool ready);
    void send_offer();

    void apply_remote_description(const SessionDescription& desc);

    void create_transport();
    void discard_transport();

    void send_signal(SignalKind kind, std::optional<nlohmann::json> payload = std::nullopt);

    void set_state(SessionState state);
    void update_status(bool connected, bool connecting, std::optional<std::string> error);
    void report_error(ErrorKind kind, const std::string& message);

    void restart_inactivity_timer();
    void on_inactivity_timeout();

    void exit_room(ExitReason reason);

    bool toggle_local(const std::string& kind);

    net::io_context& io_context_;
    std::shared_ptr<RelayClient> relay_;
    std::shared_ptr<TransportFactory> transport_factory_;

    NegotiationConfig negotiation_config_;
    RoomConfig room_config_;

    std::string room_id_;
    NegotiationState s_;
    SessionStatus status_;

    std::unique_ptr<SessionTransport> transport_;
    uint64_t generation_ = 0;

    std::shared_ptr<LocalMedia> local_media_;
    bool media_unavailable_ = false;
    MediaReadiness media_ready_;

    std::vector<RemoteTrack> remote_tracks_;

    PresenceAnnouncer presence_;
    net::steady_timer inactivity_timer_;
    bool inactivity_connected_ = false;

    std::deque<Event> events_;
    bool processing_ = false;
    bool suspended_ = false;

    RelayClient::Unsubscribe unsubscribe_relay_;

    StatusCallback status_callback_;
    StateCallback state_callback_;
    RemoteMediaCallback remote_media_callback_;
    ExitCallback exit_callback_;
};

} // namespace duet::peer
