/**
 * @file session_coordinator.cpp
 * @brief 会话协调器实现
 */

#include "peer_endpoint/session_coordinator.hpp"

#include "duet/logger.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

namespace duet::peer {

SessionCoordinator::SessionCoordinator(net::io_context& io_context,
                                       std::shared_ptr<RelayClient> relay,
                                       std::shared_ptr<TransportFactory> transport_factory,
                                       const Config& config)
    : io_context_(io_context)
    , relay_(std::move(relay))
    , transport_factory_(std::move(transport_factory))
    , negotiation_config_(config.negotiation)
    , room_config_(config.room)
    , media_ready_(io_context)
    , presence_(io_context, config.presence,
                [this]() { send_signal(SignalKind::Join); },
                [this]() {
                    return s_.state == SessionState::AwaitingCounterpart &&
                           !status_.connecting && !status_.connected;
                })
    , inactivity_timer_(io_context)
{
    presence_.set_on_exhausted([this]() {
        update_status(status_.connected, false, status_.error);
    });
}

SessionCoordinator::~SessionCoordinator() {
    status_callback_ = nullptr;
    state_callback_ = nullptr;
    remote_media_callback_ = nullptr;
    exit_callback_ = nullptr;
    shutdown();
}

// ==================== 生命周期 ====================

void SessionCoordinator::start(const std::string& room_id) {
    if (s_.state != SessionState::Idle && s_.state != SessionState::Failed) {
        LOG_WARN("[SessionCoordinator] already in room " << room_id_);
        return;
    }

    room_id_ = room_id;

    if (unsubscribe_relay_) {
        unsubscribe_relay_();
    }

    std::weak_ptr<SessionCoordinator> weak = weak_from_this();
    unsubscribe_relay_ = relay_->on_message([weak](const SignalMessage& msg) {
        if (auto self = weak.lock()) {
            Event event;
            event.type = Event::Type::Signal;
            event.message = msg;
            self->enqueue(std::move(event));
        }
    });

    LOG_INFO("[SessionCoordinator] " << relay_->self_id() << " joining room " << room_id_);

    relay_->connect(room_id_, [weak](const std::optional<Error>& error) {
        if (auto self = weak.lock()) {
            self->on_relay_connected(error);
        }
    });
}

void SessionCoordinator::on_relay_connected(const std::optional<Error>& error) {
    if (s_.state == SessionState::Closed) {
        return;
    }

    if (error) {
        set_state(SessionState::Failed);
        report_error(ErrorKind::RelayUnavailable,
                     "Failed to connect to signaling service: " + error->message);
        return;
    }

    update_status(false, false, std::nullopt);
    restart_inactivity_timer();
    enter_awaiting_counterpart();
}

void SessionCoordinator::shutdown() {
    if (s_.state == SessionState::Closed) {
        return;
    }

    LOG_INFO("[SessionCoordinator] leaving room " << room_id_);

    presence_.cancel();
    media_ready_.cancel();
    inactivity_timer_.cancel();
    suspended_ = false;
    events_.clear();

    // 三项释放互不影响
    try {
        if (relay_->connected()) {
            relay_->send(SignalKind::Leave, std::nullopt);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionCoordinator] failed to send leave: " << e.what());
    }

    try {
        discard_transport();
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionCoordinator] failed to close transport: " << e.what());
    }

    try {
        if (unsubscribe_relay_) {
            auto unsubscribe = std::move(unsubscribe_relay_);
            unsubscribe_relay_ = nullptr;
            unsubscribe();
        }
        relay_->disconnect();
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionCoordinator] failed to release relay: " << e.what());
    }

    s_.role.reset();
    s_.counterpart_id.clear();
    s_.processed_joins.clear();

    set_state(SessionState::Closed);
    update_status(false, false, status_.error);
}

void SessionCoordinator::exit_room(ExitReason reason) {
    LOG_INFO("[SessionCoordinator] exiting room: " << to_string(reason));
    if (exit_callback_) {
        exit_callback_(reason);
    }
    shutdown();
}

// ==================== 事件队列 ====================

void SessionCoordinator::enqueue(Event event) {
    if (s_.state == SessionState::Closed) {
        return;
    }
    events_.push_back(std::move(event));
    process_events();
}

void SessionCoordinator::process_events() {
    if (processing_) {
        return;
    }
    processing_ = true;

    while (!suspended_ && !events_.empty()) {
        Event event = std::move(events_.front());
        events_.pop_front();

        try {
            dispatch(event);
        } catch (const SessionError& e) {
            report_error(e.kind(), e.what());
        } catch (const std::exception& e) {
            report_error(ErrorKind::NegotiationFailed, e.what());
        }
    }

    processing_ = false;
}

void SessionCoordinator::dispatch(const Event& event) {
    if (event.type == Event::Type::Signal) {
        const auto& msg = event.message;

        if (s_.state == SessionState::Idle || s_.state == SessionState::Failed ||
            s_.state == SessionState::Closed) {
            return;
        }
        if (msg.sender_id == relay_->self_id() || msg.room_id != room_id_) {
            return;
        }

        LOG_DEBUG("[SessionCoordinator] received " << kind_to_string(msg.kind)
                  << " from " << msg.sender_id);

        switch (msg.kind) {
            case SignalKind::Join: handle_join(msg); break;
            case SignalKind::Offer: handle_offer(msg); break;
            case SignalKind::Answer: handle_answer(msg); break;
            case SignalKind::IceCandidate: handle_candidate(msg); break;
            case SignalKind::Leave: handle_leave(msg); break;
            case SignalKind::Kick: handle_kick(msg); break;
        }
        return;
    }

    // 已丢弃传输的回调
    if (event.generation != generation_ || !transport_) {
        LOG_DEBUG("[SessionCoordinator] ignoring event from discarded transport");
        return;
    }

    switch (event.type) {
        case Event::Type::TransportState:
            handle_transport_state(event.transport_state);
            break;
        case Event::Type::LocalCandidate:
            handle_local_candidate(event.candidate);
            break;
        case Event::Type::RemoteTrack:
            handle_remote_track(event.track);
            break;
        case Event::Type::Signal:
            break;
    }
}

// ==================== 信令处理 ====================

void SessionCoordinator::handle_join(const SignalMessage& msg) {
    const auto key = std::make_pair(msg.sender_id, msg.room_id);
    if (s_.processed_joins.count(key)) {
        LOG_DEBUG("[SessionCoordinator] duplicate join from " << msg.sender_id);
        return;
    }
    if (s_.state != SessionState::AwaitingCounterpart) {
        LOG_DEBUG("[SessionCoordinator] ignoring join from " << msg.sender_id
                  << " in state " << to_string(s_.state));
        return;
    }

    s_.processed_joins.insert(key);
    begin_negotiation(msg.sender_id);

    if (s_.role == NegotiationRole::Leader) {
        wait_for_media_then_offer();
    } else {
        // 对端可能错过了我们之前的 Join，回应一次让它知道有人在等 Offer
        LOG_INFO("[SessionCoordinator] waiting for offer from " << msg.sender_id);
        send_signal(SignalKind::Join);
    }
}

void SessionCoordinator::begin_negotiation(const std::string& peer_id) {
    s_.counterpart_id = peer_id;
    s_.role = resolve_role(relay_->self_id(), peer_id);
    presence_.cancel();

    LOG_INFO("[SessionCoordinator] counterpart " << peer_id << " found, role="
             << to_string(*s_.role));

    set_state(SessionState::Negotiating);
    update_status(false, true, std::nullopt);
}

void SessionCoordinator::handle_offer(const SignalMessage& msg) {
    if (!s_.counterpart_id.empty() && msg.sender_id != s_.counterpart_id) {
        LOG_WARN("[SessionCoordinator] ignoring offer from " << msg.sender_id
                 << ", counterpart is " << s_.counterpart_id);
        return;
    }

    std::optional<SessionDescription> desc;
    if (msg.payload) {
        desc = json_to_description(*msg.payload);
    }
    if (!desc || desc->type != "offer") {
        LOG_WARN("[SessionCoordinator] malformed offer from " << msg.sender_id);
        return;
    }

    s_.processed_joins.insert(std::make_pair(msg.sender_id, msg.room_id));

    if (s_.state == SessionState::AwaitingCounterpart) {
        begin_negotiation(msg.sender_id);
    } else {
        set_state(SessionState::Negotiating);
        update_status(false, true, std::nullopt);
    }

    try {
        if (!transport_) {
            create_transport();
        }

        // 任何一方在协商中收到 Offer 都先回滚自己的本地 Offer
        if (transport_->signaling_state() != SignalingState::Stable) {
            LOG_INFO("[SessionCoordinator] glare detected ("
                     << to_string(transport_->signaling_state()) << "), rolling back");
            transport_->rollback();
        }

        apply_remote_description(*desc);

        auto answer = transport_->create_answer();
        LOG_INFO("[SessionCoordinator] sending answer to " << msg.sender_id);
        send_signal(SignalKind::Answer, description_to_json(answer));
    } catch (const std::exception& e) {
        report_error(ErrorKind::NegotiationFailed, std::string("Failed to answer offer: ") + e.what());
        return;
    }

    // 已连接时的重新协商不会再收到 connected 通知
    if (transport_ && transport_->connection_state() == TransportState::Connected) {
        handle_transport_state(TransportState::Connected);
    }
}

void SessionCoordinator::handle_answer(const SignalMessage& msg) {
    if (!transport_ || transport_->signaling_state() != SignalingState::HaveLocalOffer) {
        LOG_DEBUG("[SessionCoordinator] ignoring answer, no local offer pending");
        return;
    }
    if (!s_.counterpart_id.empty() && msg.sender_id != s_.counterpart_id) {
        LOG_WARN("[SessionCoordinator] ignoring answer from " << msg.sender_id);
        return;
    }

    std::optional<SessionDescription> desc;
    if (msg.payload) {
        desc = json_to_description(*msg.payload);
    }
    if (!desc || desc->type != "answer") {
        LOG_WARN("[SessionCoordinator] malformed answer from " << msg.sender_id);
        return;
    }

    try {
        apply_remote_description(*desc);
        LOG_INFO("[SessionCoordinator] answer applied");
    } catch (const std::exception& e) {
        report_error(ErrorKind::NegotiationFailed, std::string("Failed to apply answer: ") + e.what());
    }
}

void SessionCoordinator::handle_candidate(const SignalMessage& msg) {
    if (!s_.counterpart_id.empty() && msg.sender_id != s_.counterpart_id) {
        LOG_DEBUG("[SessionCoordinator] ignoring candidate from " << msg.sender_id);
        return;
    }

    std::optional<IceCandidate> candidate;
    if (msg.payload) {
        candidate = json_to_candidate(*msg.payload);
    }
    if (!candidate) {
        LOG_WARN("[SessionCoordinator] malformed candidate from " << msg.sender_id);
        return;
    }
    if (!transport_) {
        return;
    }

    if (!s_.remote_description_set) {
        s_.candidates.enqueue(*candidate);
        LOG_DEBUG("[SessionCoordinator] queued candidate (" << s_.candidates.size() << " pending)");
        return;
    }

    try {
        transport_->add_remote_candidate(*candidate);
    } catch (const std::exception& e) {
        LOG_WARN("[SessionCoordinator] failed to add candidate: " << e.what());
    }
}

void SessionCoordinator::handle_leave(const SignalMessage& msg) {
    if (!s_.counterpart_id.empty() && msg.sender_id != s_.counterpart_id) {
        LOG_DEBUG("[SessionCoordinator] ignoring leave from " << msg.sender_id);
        return;
    }

    LOG_INFO("[SessionCoordinator] peer " << msg.sender_id << " left");

    for (auto it = s_.processed_joins.begin(); it != s_.processed_joins.end();) {
        if (it->second == msg.room_id) {
            it = s_.processed_joins.erase(it);
        } else {
            ++it;
        }
    }

    update_status(false, false, std::string("Peer disconnected"));
    enter_awaiting_counterpart();
}

void SessionCoordinator::handle_kick(const SignalMessage& msg) {
    LOG_WARN("[SessionCoordinator] removed from room by " << msg.sender_id);
    exit_room(ExitReason::Removed);
}

// ==================== 传输事件 ====================

void SessionCoordinator::handle_transport_state(TransportState state) {
    LOG_DEBUG("[SessionCoordinator] transport state: " << to_string(state));

    switch (state) {
        case TransportState::New:
            break;

        case TransportState::Connecting:
            if (s_.state == SessionState::Negotiating && !status_.connecting) {
                update_status(false, true, status_.error);
            }
            break;

        case TransportState::Connected:
            if (s_.state == SessionState::Connected) {
                break;
            }
            presence_.cancel();
            set_state(SessionState::Connected);
            update_status(true, false, std::nullopt);
            LOG_INFO("[SessionCoordinator] connected to " << s_.counterpart_id);
            break;

        case TransportState::Disconnected:
        case TransportState::Failed:
        case TransportState::Closed:
            LOG_WARN("[SessionCoordinator] transport " << to_string(state)
                     << ", waiting for a counterpart again");
            if (!s_.counterpart_id.empty()) {
                // 允许同一对端重新宣告后再次协商
                s_.processed_joins.erase(std::make_pair(s_.counterpart_id, room_id_));
            }
            update_status(false, false, std::string("Connection ") + to_string(state));
            enter_awaiting_counterpart();
            break;
    }
}

void SessionCoordinator::handle_local_candidate(const IceCandidate& candidate) {
    send_signal(SignalKind::IceCandidate, candidate_to_json(candidate));
}

void SessionCoordinator::handle_remote_track(const RemoteTrack& track) {
    LOG_INFO("[SessionCoordinator] remote " << track.kind << " track received");
    remote_tracks_.push_back(track);
    if (s_.state == SessionState::Connected && remote_media_callback_) {
        remote_media_callback_(RemoteMedia{remote_tracks_});
    }
}

// ==================== 内部流程 ====================

void SessionCoordinator::enter_awaiting_counterpart() {
    presence_.cancel();
    media_ready_.cancel();
    suspended_ = false;

    discard_transport();
    s_.role.reset();
    s_.counterpart_id.clear();

    set_state(SessionState::AwaitingCounterpart);

    try {
        create_transport();
    } catch (const std::exception& e) {
        report_error(ErrorKind::NegotiationFailed,
                     std::string("Failed to create session transport: ") + e.what());
    }

    presence_.start();
}

void SessionCoordinator::wait_for_media_then_offer() {
    if (local_media_ || media_unavailable_ || negotiation_config_.media_wait_ms <= 0) {
        send_offer();
        return;
    }

    LOG_INFO("[SessionCoordinator] waiting up to " << negotiation_config_.media_wait_ms
             << "ms for local media");

    // 等待期间暂停事件队列，须在 wait 之前设置（可能同步完成）
    suspended_ = true;
    const uint64_t generation = generation_;
    std::weak_ptr<SessionCoordinator> weak = weak_from_this();
    media_ready_.wait(std::chrono::milliseconds(negotiation_config_.media_wait_ms),
                      [weak, generation](bool ready) {
                          if (auto self = weak.lock()) {
                              self->resume_after_media_wait(generation, ready);
                          }
                      });
}

void SessionCoordinator::resume_after_media_wait(uint64_t generation, bool ready) {
    suspended_ = false;

    if (!ready) {
        LOG_WARN("[SessionCoordinator] local media not ready, proceeding without media tracks");
    }

    if (generation == generation_ && s_.state == SessionState::Negotiating &&
        s_.role == NegotiationRole::Leader) {
        send_offer();
    }

    process_events();
}

void SessionCoordinator::send_offer() {
    if (!transport_) {
        report_error(ErrorKind::NegotiationFailed, "Failed to create offer: no session transport");
        return;
    }

    try {
        if (transport_->signaling_state() != SignalingState::Stable) {
            LOG_INFO("[SessionCoordinator] not stable, rolling back before offer");
            transport_->rollback();
        }

        auto offer = transport_->create_offer();
        LOG_INFO("[SessionCoordinator] sending offer to " << s_.counterpart_id);
        send_signal(SignalKind::Offer, description_to_json(offer));
    } catch (const std::exception& e) {
        report_error(ErrorKind::NegotiationFailed, std::string("Failed to create offer: ") + e.what());
    }
}

void SessionCoordinator::apply_remote_description(const SessionDescription& desc) {
    transport_->set_remote_description(desc);
    s_.remote_description_set = true;

    const auto pending = s_.candidates.size();
    if (pending > 0) {
        auto applied = s_.candidates.drain_into(*transport_);
        LOG_INFO("[SessionCoordinator] applied " << applied << "/" << pending << " queued candidates");
    }
}

void SessionCoordinator::create_transport() {
    const uint64_t generation = ++generation_;

    // 传输回调可能来自其他线程，统一投递回 io_context
    std::weak_ptr<SessionCoordinator> weak = weak_from_this();
    net::io_context* io_context = &io_context_;
    auto post_event = [io_context, weak](Event event) {
        net::post(*io_context, [weak, event]() {
            if (auto self = weak.lock()) {
                self->enqueue(event);
            }
        });
    };

    SessionTransport::Callbacks callbacks;
    callbacks.on_local_candidate = [post_event, generation](const IceCandidate& candidate) {
        Event event;
        event.type = Event::Type::LocalCandidate;
        event.generation = generation;
        event.candidate = candidate;
        post_event(std::move(event));
    };
    callbacks.on_state = [post_event, generation](TransportState state) {
        Event event;
        event.type = Event::Type::TransportState;
        event.generation = generation;
        event.transport_state = state;
        post_event(std::move(event));
    };
    callbacks.on_remote_track = [post_event, generation](const RemoteTrack& track) {
        Event event;
        event.type = Event::Type::RemoteTrack;
        event.generation = generation;
        event.track = track;
        post_event(std::move(event));
    };

    s_.candidates.clear();
    s_.remote_description_set = false;
    remote_tracks_.clear();

    transport_ = transport_factory_->create(std::move(callbacks));
    LOG_DEBUG("[SessionCoordinator] created session transport #" << generation);

    if (local_media_) {
        transport_->attach_local_media(*local_media_);
    }
}

void SessionCoordinator::discard_transport() {
    // 先置空再关闭，关闭过程中产生的回调都会被当作过期事件
    auto transport = std::move(transport_);
    transport_.reset();

    s_.candidates.clear();
    s_.remote_description_set = false;
    remote_tracks_.clear();

    if (!transport) {
        return;
    }

    try {
        transport->close();
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionCoordinator] transport close failed: " << e.what());
    }
}

void SessionCoordinator::send_signal(SignalKind kind, std::optional<nlohmann::json> payload) {
    std::weak_ptr<SessionCoordinator> weak = weak_from_this();
    relay_->send(kind, std::move(payload), [weak](const std::optional<Error>& error) {
        if (!error) return;
        if (auto self = weak.lock()) {
            self->report_error(error->kind, error->message);
        }
    });
}

// ==================== 状态 ====================

void SessionCoordinator::set_state(SessionState state) {
    if (s_.state == state) {
        return;
    }

    const SessionState previous = s_.state;
    s_.state = state;
    LOG_INFO("[SessionCoordinator] " << to_string(previous) << " -> " << to_string(state));

    if (state_callback_) {
        state_callback_(state);
    }

    if (remote_media_callback_) {
        if (previous == SessionState::Connected) {
            remote_media_callback_(std::nullopt);
        } else if (state == SessionState::Connected) {
            remote_media_callback_(RemoteMedia{remote_tracks_});
        }
    }
}

void SessionCoordinator::update_status(bool connected, bool connecting, std::optional<std::string> error) {
    SessionStatus next;
    next.connected = connected;
    next.connecting = connecting;
    next.error = std::move(error);

    if (next != status_) {
        status_ = next;
        if (status_callback_) {
            status_callback_(status_);
        }
    }

    if (connected != inactivity_connected_) {
        inactivity_connected_ = connected;
        restart_inactivity_timer();
    }
}

void SessionCoordinator::report_error(ErrorKind kind, const std::string& message) {
    LOG_ERROR("[SessionCoordinator] " << to_string(kind) << ": " << message);
    update_status(status_.connected, status_.connecting, message);
}

std::optional<RemoteMedia> SessionCoordinator::remote_media() const {
    if (s_.state != SessionState::Connected) {
        return std::nullopt;
    }
    return RemoteMedia{remote_tracks_};
}

// ==================== 房间超时 ====================

void SessionCoordinator::restart_inactivity_timer() {
    inactivity_timer_.cancel();
    if (room_config_.inactivity_timeout_sec <= 0 || s_.state == SessionState::Closed) {
        return;
    }

    inactivity_timer_.expires_after(std::chrono::seconds(room_config_.inactivity_timeout_sec));
    std::weak_ptr<SessionCoordinator> weak = weak_from_this();
    inactivity_timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->on_inactivity_timeout();
        }
    });
}

void SessionCoordinator::on_inactivity_timeout() {
    if (status_.connected || s_.state == SessionState::Closed) {
        return;
    }
    LOG_INFO("[SessionCoordinator] nobody connected for "
             << room_config_.inactivity_timeout_sec << "s");
    exit_room(ExitReason::InactivityTimeout);
}

// ==================== 媒体与命令 ====================

void SessionCoordinator::set_local_media(std::shared_ptr<LocalMedia> media) {
    local_media_ = std::move(media);
    if (!local_media_) {
        return;
    }
    media_unavailable_ = false;

    if (transport_) {
        try {
            transport_->attach_local_media(*local_media_);
        } catch (const std::exception& e) {
            report_error(ErrorKind::NegotiationFailed,
                         std::string("Failed to attach local media: ") + e.what());
        }
    }

    media_ready_.notify_ready();
}

void SessionCoordinator::report_media_unavailable(const std::string& reason) {
    media_unavailable_ = true;
    report_error(ErrorKind::MediaUnavailable, "Camera/Mic unavailable: " + reason);

    // 不再等待，直接不带媒体继续
    if (media_ready_.waiting()) {
        media_ready_.cancel();
        resume_after_media_wait(generation_, false);
    }
}

bool SessionCoordinator::toggle_local(const std::string& kind) {
    if (!local_media_) {
        return false;
    }
    auto enabled = local_media_->toggle(kind);
    if (!enabled) {
        return false;
    }
    LOG_INFO("[SessionCoordinator] local " << kind << (*enabled ? " enabled" : " disabled"));
    return *enabled;
}

bool SessionCoordinator::toggle_local_audio() {
    return toggle_local("audio");
}

bool SessionCoordinator::toggle_local_video() {
    return toggle_local("video");
}

void SessionCoordinator::force_remove_peer() {
    if (s_.state == SessionState::Idle || s_.state == SessionState::Failed ||
        s_.state == SessionState::Closed) {
        LOG_WARN("[SessionCoordinator] not in a room, cannot remove peer");
        return;
    }
    LOG_INFO("[SessionCoordinator] removing peer " << s_.counterpart_id);
    send_signal(SignalKind::Kick);
}

} // namespace duet::peer
