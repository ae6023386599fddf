/**
 * @file session_harness.hpp
 * @brief 会话协调器测试夹具
 */

#pragma once

#include "peer_endpoint/session_coordinator.hpp"

#include "fake_transport.hpp"
#include "test_relay.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace duet::peer::testing {

/**
 * @brief 一个参与者：协调器 + 它的传输工厂 + 观察到的状态
 */
struct Participant {
    std::string id;
    std::shared_ptr<FakeTransportFactory> transports;
    std::shared_ptr<RelayClient> relay;
    std::shared_ptr<SessionCoordinator> coordinator;

    std::vector<SessionState> states;
    std::vector<SessionStatus> statuses;
    std::vector<std::optional<RemoteMedia>> remote_media;
    std::optional<ExitReason> exit_reason;

    SessionCoordinator& operator*() { return *coordinator; }
    SessionCoordinator* operator->() { return coordinator.get(); }

    std::shared_ptr<TransportRecord> transport() const { return transports->last(); }
};

class SessionTest : public ::testing::Test {
protected:
    static constexpr const char* kRoom = "sunnyriver42";
    static constexpr const char* kTopic = "room-sunnyriver42";

    void SetUp() override {
        hub_ = std::make_shared<RelayHub>(io_);

        config_.relay.subscribe_timeout_ms = 200;
        config_.relay.disconnect_grace_ms = 50;
        config_.presence.interval_ms = 1000;
        config_.presence.max_retries = 5;
        config_.negotiation.media_wait_ms = 50;
        config_.room.inactivity_timeout_sec = 0;
    }

    void TearDown() override {
        participants_.clear();
    }

    Participant& add(const std::string& id, bool with_media = true) {
        auto p = std::make_unique<Participant>();
        p->id = id;
        p->transports = std::make_shared<FakeTransportFactory>();
        p->relay = std::make_shared<RelayClient>(io_, hub_->factory(), id, config_.relay);
        p->coordinator = std::make_shared<SessionCoordinator>(io_, p->relay, p->transports, config_);

        Participant* raw = p.get();
        p->coordinator->set_state_callback([raw](SessionState s) { raw->states.push_back(s); });
        p->coordinator->set_status_callback([raw](const SessionStatus& s) { raw->statuses.push_back(s); });
        p->coordinator->set_remote_media_callback([raw](const std::optional<RemoteMedia>& media) {
            raw->remote_media.push_back(media);
        });
        p->coordinator->set_exit_callback([raw](ExitReason reason) { raw->exit_reason = reason; });

        if (with_media) {
            p->coordinator->set_local_media(LocalMedia::from_config(MediaConfig{}));
        }

        participants_.push_back(std::move(p));
        return *participants_.back();
    }

    // 加入房间并等待进入 AwaitingCounterpart
    void join(Participant& p) {
        p->start(kRoom);
        ASSERT_TRUE(wait_state(p, SessionState::AwaitingCounterpart));
    }

    bool wait_state(Participant& p, SessionState state,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        return run_until(io_, [&]() { return p->state() == state; }, timeout);
    }

    bool wait(const std::function<bool()>& done,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        return run_until(io_, done, timeout);
    }

    void settle(std::chrono::milliseconds duration = std::chrono::milliseconds(30)) {
        run_for(io_, duration);
    }

    // 以脚本化的对端身份发送信令
    void inject(const std::string& sender, SignalKind kind,
                std::optional<nlohmann::json> payload = std::nullopt) {
        hub_->inject(kTopic, make_message(kind, kRoom, sender, std::move(payload)));
    }

    void inject_offer(const std::string& sender, const std::string& sdp = "v=0 scripted-offer") {
        inject(sender, SignalKind::Offer, description_to_json(SessionDescription{"offer", sdp}));
    }

    void inject_answer(const std::string& sender, const std::string& sdp = "v=0 scripted-answer") {
        inject(sender, SignalKind::Answer, description_to_json(SessionDescription{"answer", sdp}));
    }

    void inject_candidate(const std::string& sender, const std::string& candidate) {
        inject(sender, SignalKind::IceCandidate, candidate_to_json(IceCandidate{candidate, "0", 0}));
    }

    std::size_t sent(SignalKind kind, const std::string& sender) const {
        return hub_->count(kind, sender);
    }

    net::io_context io_;
    std::shared_ptr<RelayHub> hub_;
    Config config_;
    std::vector<std::unique_ptr<Participant>> participants_;
};

} // namespace duet::peer::testing
