/**
 * @file test_session_coordinator.cpp
 * @brief 会话协调器测试（对端由测试脚本扮演）
 */

#include "session_harness.hpp"

using namespace duet::peer;
using namespace duet::peer::testing;
using namespace std::chrono_literals;

// ==================== 加入房间 ====================

TEST_F(SessionTest, JoinSubscribesAndAnnounces) {
    auto& a1 = add("a1");
    join(a1);

    EXPECT_EQ(sent(SignalKind::Join, "a1"), 1u);
    EXPECT_TRUE(a1->has_transport());
    EXPECT_EQ(a1.transports->records().size(), 1u);
    EXPECT_EQ(a1.transport()->media_attached, 1);
    EXPECT_FALSE(a1->status().connected);
    EXPECT_FALSE(a1->status().connecting);
    EXPECT_FALSE(a1->status().error.has_value());
}

TEST_F(SessionTest, RelayUnavailableFailsAndCanRetry) {
    hub_->set_mode(RelayHub::Mode::Refuse);
    auto& a1 = add("a1");
    a1->start(kRoom);

    ASSERT_TRUE(wait_state(a1, SessionState::Failed));
    ASSERT_TRUE(a1->status().error.has_value());
    EXPECT_NE(a1->status().error->find("Failed to connect to signaling service"), std::string::npos);
    EXPECT_FALSE(a1->has_transport());

    hub_->set_mode(RelayHub::Mode::Normal);
    join(a1);
    EXPECT_FALSE(a1->status().error.has_value());
}

TEST_F(SessionTest, RelayTimeoutFails) {
    hub_->set_mode(RelayHub::Mode::Silent);
    auto& a1 = add("a1");
    a1->start(kRoom);

    ASSERT_TRUE(wait_state(a1, SessionState::Failed));
    ASSERT_TRUE(a1->status().error.has_value());
    EXPECT_NE(a1->status().error->find("TIMED_OUT"), std::string::npos);
}

TEST_F(SessionTest, PresenceIsBounded) {
    config_.presence.interval_ms = 10;
    auto& a1 = add("a1");
    join(a1);

    settle(200ms);
    EXPECT_EQ(sent(SignalKind::Join, "a1"), 6u);
    EXPECT_EQ(a1->state(), SessionState::AwaitingCounterpart);
    EXPECT_FALSE(a1->status().connecting);
    EXPECT_FALSE(a1->status().error.has_value());
}

// ==================== 发现对端 ====================

TEST_F(SessionTest, LeaderOffersOnJoin) {
    auto& a1 = add("a1");
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait([&]() { return sent(SignalKind::Offer, "a1") == 1; }));

    EXPECT_EQ(a1->state(), SessionState::Negotiating);
    EXPECT_EQ(a1->role(), NegotiationRole::Leader);
    EXPECT_EQ(a1->counterpart_id(), "b2");
    EXPECT_TRUE(a1->status().connecting);
    EXPECT_EQ(a1.transport()->signaling, SignalingState::HaveLocalOffer);
}

TEST_F(SessionTest, DuplicateJoinIsProcessedOnce) {
    auto& a1 = add("a1");
    join(a1);

    inject("b2", SignalKind::Join);
    inject("b2", SignalKind::Join);
    inject("b2", SignalKind::Join);
    settle(50ms);

    EXPECT_EQ(sent(SignalKind::Offer, "a1"), 1u);
    EXPECT_EQ(a1.transport()->offers, 1);
    EXPECT_EQ(a1.transports->records().size(), 1u);
}

TEST_F(SessionTest, FollowerRepliesToJoinAndWaitsForOffer) {
    auto& b2 = add("b2");
    join(b2);
    ASSERT_EQ(sent(SignalKind::Join, "b2"), 1u);

    inject("a1", SignalKind::Join);
    ASSERT_TRUE(wait_state(b2, SessionState::Negotiating));
    settle();

    EXPECT_EQ(b2->role(), NegotiationRole::Follower);
    EXPECT_EQ(sent(SignalKind::Join, "b2"), 2u);
    EXPECT_EQ(sent(SignalKind::Offer, "b2"), 0u);
}

TEST_F(SessionTest, FollowerAnswersAndConnects) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));
    settle();

    EXPECT_EQ(sent(SignalKind::Answer, "b2"), 1u);
    EXPECT_EQ(sent(SignalKind::IceCandidate, "b2"), 1u);
    EXPECT_TRUE(b2->status().connected);
    EXPECT_FALSE(b2->status().connecting);
    EXPECT_FALSE(b2->status().error.has_value());
}

TEST_F(SessionTest, OfferWithoutJoinStartsNegotiation) {
    auto& b2 = add("b2");
    join(b2);

    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));
    EXPECT_EQ(b2->counterpart_id(), "a1");
    EXPECT_EQ(b2->role(), NegotiationRole::Follower);
}

TEST_F(SessionTest, LeaderConnectsOnAnswer) {
    auto& a1 = add("a1");
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait([&]() { return sent(SignalKind::Offer, "a1") == 1; }));

    inject_answer("b2");
    ASSERT_TRUE(wait_state(a1, SessionState::Connected));
    EXPECT_TRUE(a1->status().connected);
    EXPECT_TRUE(a1->has_remote_description());
}

TEST_F(SessionTest, AnswerWithoutLocalOfferIsIgnored) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    inject_answer("a1");
    settle(50ms);

    EXPECT_EQ(b2->state(), SessionState::Negotiating);
    EXPECT_FALSE(b2->has_remote_description());
    EXPECT_FALSE(b2->status().error.has_value());
}

TEST_F(SessionTest, OfferFromThirdPartyIsIgnored) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    ASSERT_TRUE(wait_state(b2, SessionState::Negotiating));

    inject_offer("c3");
    settle(50ms);
    EXPECT_EQ(sent(SignalKind::Answer, "b2"), 0u);
    EXPECT_EQ(b2->counterpart_id(), "a1");
}

// ==================== candidate 顺序 ====================

TEST_F(SessionTest, CandidatesBeforeOfferAreAppliedInOrder) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    inject_candidate("a1", "c1");
    inject_candidate("a1", "c2");
    inject_candidate("a1", "c3");
    ASSERT_TRUE(wait([&]() { return b2->pending_candidate_count() == 3; }));
    EXPECT_TRUE(b2.transport()->applied_candidates.empty());

    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));
    EXPECT_EQ(b2->pending_candidate_count(), 0u);

    inject_candidate("a1", "c4");
    ASSERT_TRUE(wait([&]() { return b2.transport()->applied_candidates.size() == 4; }));

    const auto& applied = b2.transport()->applied_candidates;
    EXPECT_EQ(applied[0].candidate, "c1");
    EXPECT_EQ(applied[1].candidate, "c2");
    EXPECT_EQ(applied[2].candidate, "c3");
    EXPECT_EQ(applied[3].candidate, "c4");
}

TEST_F(SessionTest, UnusableCandidateIsSkipped) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    inject_candidate("a1", "c1");
    inject_candidate("a1", "bad");
    inject_candidate("a1", "c2");
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));

    inject_candidate("a1", "bad");
    settle();

    const auto& applied = b2.transport()->applied_candidates;
    ASSERT_EQ(applied.size(), 2u);
    EXPECT_EQ(applied[0].candidate, "c1");
    EXPECT_EQ(applied[1].candidate, "c2");
    EXPECT_EQ(b2->state(), SessionState::Connected);
    EXPECT_FALSE(b2->status().error.has_value());
}

TEST_F(SessionTest, CandidateFromThirdPartyIsIgnored) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    inject_candidate("c3", "stray");
    settle();
    EXPECT_EQ(b2->pending_candidate_count(), 0u);
}

// ==================== glare ====================

TEST_F(SessionTest, OfferDuringLocalOfferRollsBackOnce) {
    auto& a1 = add("a1");
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait([&]() { return sent(SignalKind::Offer, "a1") == 1; }));
    ASSERT_EQ(a1.transport()->signaling, SignalingState::HaveLocalOffer);

    inject_offer("b2");
    ASSERT_TRUE(wait_state(a1, SessionState::Connected));
    settle();

    EXPECT_EQ(a1.transport()->rollbacks, 1);
    EXPECT_EQ(a1.transport()->answers, 1);
    EXPECT_EQ(sent(SignalKind::Answer, "a1"), 1u);
    EXPECT_EQ(a1.transport()->signaling, SignalingState::Stable);

    // 先前 Offer 的迟到 Answer 不再处理
    inject_answer("b2");
    settle();
    EXPECT_EQ(a1.transport()->remote_descriptions.size(), 1u);
    EXPECT_EQ(a1->state(), SessionState::Connected);
}

// ==================== 离开与失败 ====================

TEST_F(SessionTest, LeaveReturnsToAwaitingWithFreshTransport) {
    auto& b2 = add("b2");
    join(b2);
    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));

    auto old_transport = b2.transport();
    const auto joins_before = sent(SignalKind::Join, "b2");

    inject("a1", SignalKind::Leave);
    ASSERT_TRUE(wait_state(b2, SessionState::AwaitingCounterpart));

    EXPECT_TRUE(old_transport->closed);
    EXPECT_EQ(b2.transports->records().size(), 2u);
    EXPECT_FALSE(b2->has_remote_description());
    EXPECT_EQ(b2->pending_candidate_count(), 0u);
    EXPECT_FALSE(b2->role().has_value());
    EXPECT_TRUE(b2->counterpart_id().empty());
    EXPECT_FALSE(b2->status().connected);
    ASSERT_TRUE(b2->status().error.has_value());
    EXPECT_EQ(*b2->status().error, "Peer disconnected");
    EXPECT_EQ(sent(SignalKind::Join, "b2"), joins_before + 1);

    // 同一对端可以重新加入
    inject("a1", SignalKind::Join);
    ASSERT_TRUE(wait_state(b2, SessionState::Negotiating));
}

TEST_F(SessionTest, LeaveFromThirdPartyIsIgnored) {
    auto& b2 = add("b2");
    join(b2);
    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));

    inject("c3", SignalKind::Leave);
    settle();
    EXPECT_EQ(b2->state(), SessionState::Connected);
}

TEST_F(SessionTest, LeaveDropsQueuedCandidatesAndAcceptsNewSender) {
    auto& b2 = add("b2");
    join(b2);

    inject("a1", SignalKind::Join);
    inject_candidate("a1", "c1");
    inject_candidate("a1", "c2");
    ASSERT_TRUE(wait([&]() { return b2->pending_candidate_count() == 2; }));
    ASSERT_EQ(b2->state(), SessionState::Negotiating);
    auto old_transport = b2.transport();

    inject("a1", SignalKind::Leave);
    ASSERT_TRUE(wait_state(b2, SessionState::AwaitingCounterpart));
    EXPECT_EQ(b2->pending_candidate_count(), 0u);
    EXPECT_FALSE(b2->has_remote_description());
    EXPECT_TRUE(old_transport->applied_candidates.empty());
    EXPECT_TRUE(old_transport->closed);

    inject("a0", SignalKind::Join);
    ASSERT_TRUE(wait_state(b2, SessionState::Negotiating));
    ASSERT_TRUE(b2->role().has_value());
    EXPECT_EQ(*b2->role(), NegotiationRole::Follower);
    EXPECT_EQ(b2->counterpart_id(), "a0");
    EXPECT_EQ(b2->pending_candidate_count(), 0u);
}

TEST_F(SessionTest, TransportFailureReturnsToAwaiting) {
    auto& b2 = add("b2");
    join(b2);
    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));

    b2.transport()->callbacks.on_state(TransportState::Failed);
    ASSERT_TRUE(wait_state(b2, SessionState::AwaitingCounterpart));
    ASSERT_TRUE(b2->status().error.has_value());
    EXPECT_EQ(*b2->status().error, "Connection failed");

    inject("a1", SignalKind::Join);
    ASSERT_TRUE(wait_state(b2, SessionState::Negotiating));
}

TEST_F(SessionTest, EventsFromDiscardedTransportAreIgnored) {
    auto& b2 = add("b2");
    join(b2);
    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));

    auto old_transport = b2.transport();
    const auto generation = b2->transport_generation();
    inject("a1", SignalKind::Leave);
    ASSERT_TRUE(wait_state(b2, SessionState::AwaitingCounterpart));
    EXPECT_GT(b2->transport_generation(), generation);

    old_transport->callbacks.on_state(TransportState::Connected);
    old_transport->callbacks.on_local_candidate(IceCandidate{"late", "0", 0});
    const auto candidates_before = sent(SignalKind::IceCandidate, "b2");
    settle();

    EXPECT_EQ(b2->state(), SessionState::AwaitingCounterpart);
    EXPECT_EQ(sent(SignalKind::IceCandidate, "b2"), candidates_before);
}

// ==================== 本地媒体 ====================

TEST_F(SessionTest, LeaderWaitsForLocalMedia) {
    config_.negotiation.media_wait_ms = 5000;
    auto& a1 = add("a1", false);
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait_state(a1, SessionState::Negotiating));

    // 等待期间的事件暂存，恢复后按顺序处理
    inject_candidate("b2", "early");
    settle(50ms);
    EXPECT_EQ(sent(SignalKind::Offer, "a1"), 0u);
    EXPECT_EQ(a1->pending_candidate_count(), 0u);

    a1->set_local_media(LocalMedia::from_config(MediaConfig{}));
    EXPECT_EQ(sent(SignalKind::Offer, "a1"), 1u);
    EXPECT_EQ(a1.transport()->media_attached, 1);

    ASSERT_TRUE(wait([&]() { return a1->pending_candidate_count() == 1; }));
}

TEST_F(SessionTest, LeaderOffersWithoutMediaAfterTimeout) {
    config_.negotiation.media_wait_ms = 30;
    auto& a1 = add("a1", false);
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait([&]() { return sent(SignalKind::Offer, "a1") == 1; }));
    EXPECT_EQ(a1.transport()->media_attached, 0);
}

TEST_F(SessionTest, MediaUnavailableStopsWaiting) {
    config_.negotiation.media_wait_ms = 5000;
    auto& a1 = add("a1", false);
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait_state(a1, SessionState::Negotiating));
    settle();
    EXPECT_EQ(sent(SignalKind::Offer, "a1"), 0u);

    a1->report_media_unavailable("permission denied");
    EXPECT_EQ(sent(SignalKind::Offer, "a1"), 1u);
    ASSERT_TRUE(a1->status().error.has_value());
    EXPECT_NE(a1->status().error->find("Camera/Mic unavailable"), std::string::npos);
}

TEST_F(SessionTest, ToggleLocalTracks) {
    auto& a1 = add("a1");
    EXPECT_FALSE(a1->toggle_local_audio());
    EXPECT_TRUE(a1->toggle_local_audio());
    EXPECT_FALSE(a1->toggle_local_video());

    auto& b2 = add("b2", false);
    EXPECT_FALSE(b2->toggle_local_audio());
}

TEST_F(SessionTest, RemoteMediaOnlyWhileConnected) {
    auto& b2 = add("b2");
    b2.transports->emit_tracks = true;
    join(b2);
    EXPECT_FALSE(b2->remote_media().has_value());

    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait([&]() {
        auto media = b2->remote_media();
        return media && media->tracks.size() == 1;
    }));
    EXPECT_EQ(b2->remote_media()->tracks[0].kind, "audio");

    inject("a1", SignalKind::Leave);
    ASSERT_TRUE(wait_state(b2, SessionState::AwaitingCounterpart));
    EXPECT_FALSE(b2->remote_media().has_value());
    ASSERT_FALSE(b2.remote_media.empty());
    EXPECT_FALSE(b2.remote_media.back().has_value());
}

// ==================== 退出房间 ====================

TEST_F(SessionTest, KickExitsRoom) {
    auto& b2 = add("b2");
    join(b2);
    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));
    auto transport = b2.transport();

    inject("a1", SignalKind::Kick);
    ASSERT_TRUE(wait_state(b2, SessionState::Closed));

    ASSERT_TRUE(b2.exit_reason.has_value());
    EXPECT_EQ(*b2.exit_reason, ExitReason::Removed);
    EXPECT_TRUE(transport->closed);
    EXPECT_FALSE(b2->has_transport());
    EXPECT_EQ(sent(SignalKind::Leave, "b2"), 1u);
    EXPECT_EQ(hub_->subscriber_count(kTopic), 0u);
}

TEST_F(SessionTest, KickDuringMediaWaitIsHandledAfterWait) {
    config_.negotiation.media_wait_ms = 300;
    auto& a1 = add("a1", false);
    join(a1);

    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait_state(a1, SessionState::Negotiating));

    inject("b2", SignalKind::Kick);
    settle(50ms);
    EXPECT_EQ(a1->state(), SessionState::Negotiating);
    EXPECT_FALSE(a1.exit_reason.has_value());

    ASSERT_TRUE(wait_state(a1, SessionState::Closed));
    ASSERT_TRUE(a1.exit_reason.has_value());
    EXPECT_EQ(*a1.exit_reason, ExitReason::Removed);
}

TEST_F(SessionTest, ForceRemovePeerSendsKick) {
    auto& a1 = add("a1");
    a1->force_remove_peer();
    EXPECT_EQ(sent(SignalKind::Kick, "a1"), 0u);

    join(a1);
    inject("b2", SignalKind::Join);
    ASSERT_TRUE(wait_state(a1, SessionState::Negotiating));

    a1->force_remove_peer();
    ASSERT_TRUE(wait([&]() { return sent(SignalKind::Kick, "a1") == 1; }));
    EXPECT_EQ(a1->state(), SessionState::Negotiating);
}

TEST_F(SessionTest, ShutdownSendsLeaveAndReleasesEverything) {
    auto& b2 = add("b2");
    join(b2);
    inject("a1", SignalKind::Join);
    inject_offer("a1");
    ASSERT_TRUE(wait_state(b2, SessionState::Connected));
    auto transport = b2.transport();

    b2->shutdown();
    EXPECT_EQ(b2->state(), SessionState::Closed);
    EXPECT_EQ(sent(SignalKind::Leave, "b2"), 1u);
    EXPECT_TRUE(transport->closed);
    EXPECT_FALSE(b2->status().connected);
    EXPECT_EQ(hub_->subscriber_count(kTopic), 0u);
    EXPECT_FALSE(b2.exit_reason.has_value());

    // 退出后不再处理任何信令
    inject("a1", SignalKind::Join);
    settle();
    EXPECT_EQ(b2->state(), SessionState::Closed);

    b2->shutdown();
    EXPECT_EQ(sent(SignalKind::Leave, "b2"), 1u);
}

TEST_F(SessionTest, InactivityTimeoutExitsRoom) {
    config_.room.inactivity_timeout_sec = 1;
    auto& a1 = add("a1");
    join(a1);

    ASSERT_TRUE(wait([&]() { return a1.exit_reason.has_value(); }, 3000ms));
    EXPECT_EQ(*a1.exit_reason, ExitReason::InactivityTimeout);
    EXPECT_EQ(a1->state(), SessionState::Closed);
}
