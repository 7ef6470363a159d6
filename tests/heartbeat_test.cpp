#include <gtest/gtest.h>
#include <stomp/heartbeat.hpp>
#include <stdexcept>

using namespace stomp;

TEST(HeartbeatCadenceTest, Parse_ValidValue) {
    auto cadence = HeartbeatCadence::Parse("5000,10000");

    EXPECT_EQ(cadence.send_ms, 5000u);
    EXPECT_EQ(cadence.receive_ms, 10000u);
    EXPECT_EQ(cadence.ToString(), "5000,10000");
}

TEST(HeartbeatCadenceTest, Parse_ToleratesSurroundingSpaces) {
    auto cadence = HeartbeatCadence::Parse(" 100 , 200 ");

    EXPECT_EQ(cadence.send_ms, 100u);
    EXPECT_EQ(cadence.receive_ms, 200u);
}

TEST(HeartbeatCadenceTest, Parse_MalformedValues_Throw) {
    EXPECT_THROW(HeartbeatCadence::Parse(""), std::invalid_argument);
    EXPECT_THROW(HeartbeatCadence::Parse("100"), std::invalid_argument);
    EXPECT_THROW(HeartbeatCadence::Parse("a,b"), std::invalid_argument);
    EXPECT_THROW(HeartbeatCadence::Parse("100,"), std::invalid_argument);
    EXPECT_THROW(HeartbeatCadence::Parse("-1,100"), std::invalid_argument);
    EXPECT_THROW(HeartbeatCadence::Parse("1,2,3"), std::invalid_argument);
}

TEST(HeartbeatNegotiationTest, BothSidesOffer_TakesSlowerOfEachPair) {
    // Client offers "5000,10000", broker answers "4000,6000"
    auto intervals = NegotiateHeartbeat({5000, 10000}, {4000, 6000});

    EXPECT_EQ(intervals.outgoing_ms, 6000u);
    EXPECT_EQ(intervals.incoming_ms, 10000u);
}

TEST(HeartbeatNegotiationTest, ZeroOnEitherSide_DisablesDirection) {
    const uint32_t values[] = {0, 1, 500, 30000};

    for (uint32_t a : values) {
        for (uint32_t b : values) {
            auto no_client_send = NegotiateHeartbeat({0, a}, {b, 1000});
            EXPECT_EQ(no_client_send.outgoing_ms, 0u);

            auto no_server_receive = NegotiateHeartbeat({1000, a}, {b, 0});
            EXPECT_EQ(no_server_receive.outgoing_ms, 0u);

            auto no_server_send = NegotiateHeartbeat({a, 1000}, {0, b});
            EXPECT_EQ(no_server_send.incoming_ms, 0u);

            auto no_client_receive = NegotiateHeartbeat({a, 0}, {1000, b});
            EXPECT_EQ(no_client_receive.incoming_ms, 0u);
        }
    }
}

TEST(HeartbeatNegotiationTest, DefaultCadence_DisablesHeartbeating) {
    auto intervals = NegotiateHeartbeat(HeartbeatCadence::Parse("0,0"), {10000, 10000});

    EXPECT_EQ(intervals.outgoing_ms, 0u);
    EXPECT_EQ(intervals.incoming_ms, 0u);
}
