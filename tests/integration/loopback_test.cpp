#include <gtest/gtest.h>
#include <stomp/client.hpp>
#include "loopback_broker.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace stomp;
using namespace stomp::test;

/// Loopback tests: real TcpTransport and AsioTimerService against an
/// in-process broker sharing the test's io_context
class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_unique<LoopbackBroker>(io_context_);
    }

    void TearDown() override {
        client_.reset();
        broker_.reset();
    }

    void CreateClient(ClientConfig config = {}) {
        client_ = std::make_unique<Client>(io_context_, std::move(config));
        client_->OnConnected([this](const HeaderMap&) { connected_++; });
        client_->OnDisconnected([this]() { disconnected_++; });
    }

    /// Run the io_context until condition holds or timeout_ms elapses
    bool RunUntil(std::function<bool()> condition, int timeout_ms = 5000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        while (!condition()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            io_context_.restart();
            io_context_.run_for(std::chrono::milliseconds(10));
        }

        return true;
    }

    /// Run the io_context for a fixed period
    void RunFor(int ms) {
        io_context_.restart();
        io_context_.run_for(std::chrono::milliseconds(ms));
    }

    bool ConnectAndWait(const std::string& client_heartbeat = "0,0") {
        client_->Connect("127.0.0.1", broker_->GetPort(), client_heartbeat);
        return RunUntil([this]() { return connected_ > 0 || disconnected_ > 0; }) && connected_ == 1;
    }

    bool BrokerReceived(const std::string& command) const {
        for (const auto& frame : broker_->GetFrames()) {
            if (frame.command == command) {
                return true;
            }
        }
        return false;
    }

    asio::io_context io_context_;
    std::unique_ptr<LoopbackBroker> broker_;
    std::unique_ptr<Client> client_;
    int connected_ = 0;
    int disconnected_ = 0;
};

TEST_F(LoopbackTest, Connect_HandshakeCompletes) {
    // Given: A client with credentials
    ClientConfig config;
    config.login = "guest";
    config.passcode = "guest";
    CreateClient(config);

    // When: Connecting to the loopback broker
    ASSERT_TRUE(ConnectAndWait());

    // Then: Session information comes from CONNECTED
    EXPECT_TRUE(client_->IsConnected());
    EXPECT_TRUE(broker_->HasClient());
    EXPECT_EQ(client_->GetSessionId(), "loopback-1");
    EXPECT_EQ(client_->GetServer(), "LoopbackBroker/1.0");

    ASSERT_FALSE(broker_->GetFrames().empty());
    const auto& connect = broker_->GetFrames().front();
    EXPECT_EQ(connect.command, "CONNECT");
    EXPECT_EQ(connect.headers.GetOr("accept-version"), "1.2");
    EXPECT_EQ(connect.headers.GetOr("host"), "127.0.0.1");
    EXPECT_EQ(connect.headers.GetOr("login"), "guest");
}

TEST_F(LoopbackTest, SubscribeAndSend_MessageRoundTrip) {
    CreateClient();
    ASSERT_TRUE(ConnectAndWait());

    std::vector<std::string> bodies;
    std::string subscription;
    client_->OnMessage([&](const HeaderMap& headers, const std::string& body) {
        subscription = headers.GetOr("subscription");
        bodies.push_back(body);
    });

    // When: Subscribing and sending a binary body to the same queue
    std::string id = client_->Subscribe("/queue/loopback");
    const std::string payload("bin\0ary", 7);
    client_->Send("/queue/loopback", {}, payload);
    client_->Send("/queue/loopback", {}, "second");

    // Then: Both messages come back in order, intact
    ASSERT_TRUE(RunUntil([&]() { return bodies.size() == 2; }));
    EXPECT_EQ(bodies[0], payload);
    EXPECT_EQ(bodies[1], "second");
    EXPECT_EQ(subscription, id);
}

TEST_F(LoopbackTest, Disconnect_FlushesDisconnectFrame) {
    CreateClient();
    ASSERT_TRUE(ConnectAndWait());

    client_->Disconnect();
    EXPECT_EQ(disconnected_, 1);
    EXPECT_FALSE(client_->IsConnected());

    // The DISCONNECT frame still reaches the broker after local teardown
    EXPECT_TRUE(RunUntil([this]() { return BrokerReceived("DISCONNECT"); }));
    EXPECT_TRUE(RunUntil([this]() { return broker_->IsClientGone(); }));
    EXPECT_EQ(disconnected_, 1);
}

TEST_F(LoopbackTest, Unsubscribe_StopsDelivery) {
    CreateClient();
    ASSERT_TRUE(ConnectAndWait());

    std::vector<std::string> destinations;
    client_->OnMessage([&](const HeaderMap& headers, const std::string&) {
        destinations.push_back(headers.GetOr("destination"));
    });

    std::string id = client_->Subscribe("/queue/dropped");
    client_->Subscribe("/queue/kept");
    client_->Unsubscribe(id);

    client_->Send("/queue/dropped", {}, "lost");
    client_->Send("/queue/kept", {}, "delivered");

    // Frames are handled in order, so the second message proves the first was not routed
    ASSERT_TRUE(RunUntil([&]() { return !destinations.empty(); }));
    RunFor(50);
    ASSERT_EQ(destinations.size(), 1u);
    EXPECT_EQ(destinations[0], "/queue/kept");
}

TEST_F(LoopbackTest, OutgoingHeartbeats_SentWhileIdle) {
    broker_->SetHeartbeat("0,100");
    CreateClient();
    ASSERT_TRUE(ConnectAndWait("100,0"));

    EXPECT_EQ(client_->GetHeartbeatIntervals().outgoing_ms, 100u);
    EXPECT_TRUE(RunUntil([this]() { return broker_->GetHeartbeatCount() >= 3; }, 2000));
    EXPECT_TRUE(client_->IsConnected());
}

TEST_F(LoopbackTest, SilentBroker_HeartbeatTimeoutDisconnects) {
    // Broker promises heart-beats every 100ms but never sends any
    broker_->SetHeartbeat("100,0");
    ClientConfig config;
    config.heartbeat_margin_ms = 50;
    CreateClient(config);
    ASSERT_TRUE(ConnectAndWait("0,100"));

    EXPECT_TRUE(RunUntil([this]() { return disconnected_ > 0; }, 2000));
    EXPECT_EQ(disconnected_, 1);
    EXPECT_EQ(client_->GetState(), ConnectionState::Disconnected);
}

TEST_F(LoopbackTest, BrokerHeartbeats_KeepSessionAlive) {
    broker_->SetHeartbeat("100,0");
    ClientConfig config;
    config.heartbeat_margin_ms = 50;
    CreateClient(config);
    ASSERT_TRUE(ConnectAndWait("0,100"));

    for (int i = 0; i < 6; ++i) {
        RunFor(60);
        broker_->SendRaw("\n");
    }
    RunFor(20);

    EXPECT_TRUE(client_->IsConnected());
    EXPECT_EQ(disconnected_, 0);
}

TEST_F(LoopbackTest, BrokerClosesConnection_Disconnects) {
    CreateClient();
    ASSERT_TRUE(ConnectAndWait());

    broker_->DropConnection();

    EXPECT_TRUE(RunUntil([this]() { return disconnected_ > 0; }));
    EXPECT_EQ(disconnected_, 1);
}

TEST_F(LoopbackTest, ConnectionRefused_Disconnects) {
    CreateClient();
    uint16_t port = broker_->GetPort();
    broker_.reset();

    client_->Connect("127.0.0.1", port);

    EXPECT_TRUE(RunUntil([this]() { return disconnected_ > 0; }));
    EXPECT_EQ(connected_, 0);
    EXPECT_EQ(client_->GetState(), ConnectionState::Disconnected);
}
