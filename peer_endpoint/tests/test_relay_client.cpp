/**
 * @file test_relay_client.cpp
 * @brief 中继客户端测试
 */

#include "peer_endpoint/relay_client.hpp"

#include "test_relay.hpp"

#include <gtest/gtest.h>

using namespace duet::peer;
using namespace duet::peer::testing;
using namespace std::chrono_literals;

namespace {

const std::string kRoom = "sunnyriver42";
const std::string kTopic = "room-sunnyriver42";

} // namespace

class RelayClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        hub_ = std::make_shared<RelayHub>(io_);
        config_.subscribe_timeout_ms = 50;
        config_.disconnect_grace_ms = 30;
    }

    std::shared_ptr<RelayClient> make_client(const std::string& id) {
        return std::make_shared<RelayClient>(io_, hub_->factory(), id, config_);
    }

    // 连接并等待结果
    std::optional<Error> connect(RelayClient& client) {
        bool done = false;
        std::optional<Error> result;
        client.connect(kRoom, [&](const std::optional<Error>& error) {
            result = error;
            done = true;
        });
        EXPECT_TRUE(run_until(io_, [&]() { return done; }));
        return result;
    }

    net::io_context io_;
    std::shared_ptr<RelayHub> hub_;
    RelayConfig config_;
};

TEST_F(RelayClientTest, ConnectSubscribesRoomTopic) {
    auto client = make_client("a1");
    auto error = connect(*client);

    EXPECT_FALSE(error.has_value());
    EXPECT_TRUE(client->connected());
    EXPECT_EQ(client->room_id(), kRoom);
    EXPECT_EQ(hub_->subscriber_count(kTopic), 1u);
}

TEST_F(RelayClientTest, ChannelErrorFailsConnect) {
    hub_->set_mode(RelayHub::Mode::Refuse);
    auto client = make_client("a1");
    auto error = connect(*client);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::RelayUnavailable);
    EXPECT_NE(error->message.find("CHANNEL_ERROR"), std::string::npos);
    EXPECT_FALSE(client->connected());
}

TEST_F(RelayClientTest, MissingAcknowledgmentTimesOut) {
    hub_->set_mode(RelayHub::Mode::Silent);
    auto client = make_client("a1");
    auto error = connect(*client);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::RelayUnavailable);
    EXPECT_NE(error->message.find("TIMED_OUT"), std::string::npos);

    // 失败只影响本次尝试
    hub_->set_mode(RelayHub::Mode::Normal);
    EXPECT_FALSE(connect(*client).has_value());
    EXPECT_TRUE(client->connected());
}

TEST_F(RelayClientTest, SendWithoutConnectionFails) {
    auto client = make_client("a1");
    std::optional<Error> result;
    client->send(SignalKind::Join, std::nullopt, [&](const std::optional<Error>& error) {
        result = error;
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, ErrorKind::SendFailed);
}

TEST_F(RelayClientTest, DeliversToOtherSubscribersOnly) {
    auto a = make_client("a1");
    auto b = make_client("b2");
    ASSERT_FALSE(connect(*a).has_value());
    ASSERT_FALSE(connect(*b).has_value());

    std::vector<SignalMessage> got_a;
    std::vector<SignalMessage> got_b;
    a->on_message([&](const SignalMessage& msg) { got_a.push_back(msg); });
    b->on_message([&](const SignalMessage& msg) { got_b.push_back(msg); });

    bool sent = false;
    a->send(SignalKind::Join, std::nullopt, [&](const std::optional<Error>& error) {
        EXPECT_FALSE(error.has_value());
        sent = true;
    });

    ASSERT_TRUE(run_until(io_, [&]() { return sent && !got_b.empty(); }));
    run_for(io_, 20ms);

    EXPECT_TRUE(got_a.empty());
    ASSERT_EQ(got_b.size(), 1u);
    EXPECT_EQ(got_b[0].kind, SignalKind::Join);
    EXPECT_EQ(got_b[0].sender_id, "a1");
    EXPECT_EQ(got_b[0].room_id, kRoom);
}

TEST_F(RelayClientTest, SendDuringConnectIsFlushedAfterSubscribe) {
    auto b = make_client("b2");
    ASSERT_FALSE(connect(*b).has_value());
    std::vector<SignalMessage> got_b;
    b->on_message([&](const SignalMessage& msg) { got_b.push_back(msg); });

    auto a = make_client("a1");
    a->connect(kRoom, nullptr);
    EXPECT_TRUE(a->connecting());
    a->send(SignalKind::Join, std::nullopt);

    ASSERT_TRUE(run_until(io_, [&]() { return !got_b.empty(); }));
    EXPECT_EQ(got_b[0].sender_id, "a1");
}

TEST_F(RelayClientTest, SendDuringFailedConnectFails) {
    hub_->set_mode(RelayHub::Mode::Refuse);
    auto a = make_client("a1");
    a->connect(kRoom, nullptr);

    std::optional<Error> result;
    a->send(SignalKind::Join, std::nullopt, [&](const std::optional<Error>& error) {
        result = error;
    });

    ASSERT_TRUE(run_until(io_, [&]() { return result.has_value(); }));
    EXPECT_EQ(result->kind, ErrorKind::SendFailed);
}

TEST_F(RelayClientTest, DropsOwnForeignAndMalformedMessages) {
    auto a = make_client("a1");
    ASSERT_FALSE(connect(*a).has_value());

    std::vector<SignalMessage> got;
    a->on_message([&](const SignalMessage& msg) { got.push_back(msg); });

    hub_->inject(kTopic, make_message(SignalKind::Join, kRoom, "a1"));
    hub_->inject(kTopic, make_message(SignalKind::Join, "otherroom7", "b2"));
    hub_->inject(kTopic, nlohmann::json{{"type", "wave"}, {"roomId", kRoom}, {"senderId", "b2"}});
    hub_->inject(kTopic, nlohmann::json("garbage"));
    hub_->inject(kTopic, make_message(SignalKind::Leave, kRoom, "b2"));

    ASSERT_TRUE(run_until(io_, [&]() { return !got.empty(); }));
    run_for(io_, 20ms);

    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].kind, SignalKind::Leave);
    EXPECT_EQ(got[0].sender_id, "b2");
}

TEST_F(RelayClientTest, UnsubscribedListenerStopsReceiving) {
    auto a = make_client("a1");
    ASSERT_FALSE(connect(*a).has_value());

    int first = 0;
    int second = 0;
    auto unsubscribe = a->on_message([&](const SignalMessage&) { ++first; });
    a->on_message([&](const SignalMessage&) { ++second; });
    EXPECT_EQ(a->listener_count(), 2u);

    unsubscribe();
    EXPECT_EQ(a->listener_count(), 1u);

    hub_->inject(kTopic, make_message(SignalKind::Join, kRoom, "b2"));
    ASSERT_TRUE(run_until(io_, [&]() { return second == 1; }));
    EXPECT_EQ(first, 0);
}

TEST_F(RelayClientTest, DisconnectReleasesChannelAndListeners) {
    auto a = make_client("a1");
    ASSERT_FALSE(connect(*a).has_value());
    a->on_message([](const SignalMessage&) {});

    bool done = false;
    a->disconnect([&]() { done = true; });

    EXPECT_TRUE(done);
    EXPECT_FALSE(a->connected());
    EXPECT_EQ(a->listener_count(), 0u);
    EXPECT_EQ(hub_->subscriber_count(kTopic), 0u);
}

TEST_F(RelayClientTest, DisconnectWhileConnectingWaitsForGracePeriod) {
    hub_->set_mode(RelayHub::Mode::Silent);
    config_.subscribe_timeout_ms = 5000;
    auto a = make_client("a1");

    std::optional<Error> connect_result;
    a->connect(kRoom, [&](const std::optional<Error>& error) { connect_result = error; });

    bool done = false;
    a->disconnect([&]() { done = true; });
    EXPECT_FALSE(done);

    ASSERT_TRUE(run_until(io_, [&]() { return done; }, 1000ms));
    ASSERT_TRUE(connect_result.has_value());
    EXPECT_EQ(connect_result->kind, ErrorKind::RelayUnavailable);
    EXPECT_FALSE(a->connected());
    EXPECT_FALSE(a->connecting());
}

TEST_F(RelayClientTest, DisconnectWhileConnectingCompletesAfterSubscribe) {
    auto a = make_client("a1");
    std::optional<Error> connect_result;
    bool connected = false;
    a->connect(kRoom, [&](const std::optional<Error>& error) {
        connect_result = error;
        connected = true;
    });

    bool done = false;
    a->disconnect([&]() { done = true; });

    ASSERT_TRUE(run_until(io_, [&]() { return done; }, 1000ms));
    EXPECT_TRUE(connected);
    EXPECT_FALSE(connect_result.has_value());
    EXPECT_EQ(hub_->subscriber_count(kTopic), 0u);
}

TEST_F(RelayClientTest, RelayDropAfterSubscribeDisconnects) {
    auto a = make_client("a1");
    ASSERT_FALSE(connect(*a).has_value());

    hub_->drop_all();
    ASSERT_TRUE(run_until(io_, [&]() { return !a->connected(); }));

    std::optional<Error> result;
    a->send(SignalKind::Join, std::nullopt, [&](const std::optional<Error>& error) { result = error; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, ErrorKind::SendFailed);
}
