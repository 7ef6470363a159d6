#ifndef STOMP_HEARTBEAT_HPP
#define STOMP_HEARTBEAT_HPP

#include <cstdint>
#include <string>

namespace stomp {

/// One side's heart-beat header value "<send-ms>,<receive-ms>"
struct HeartbeatCadence {
    /// Smallest interval this side can send at (0 = cannot send)
    uint32_t send_ms = 0;

    /// Interval this side wants to receive at (0 = does not want)
    uint32_t receive_ms = 0;

    /// Parse "x,y"; throws std::invalid_argument on malformed input
    static HeartbeatCadence Parse(const std::string& value);

    std::string ToString() const;
};

/// Effective intervals after negotiation; 0 disables that direction
struct HeartbeatIntervals {
    /// How often this client must send something
    uint32_t outgoing_ms = 0;

    /// Longest silence tolerated from the broker (margin not included)
    uint32_t incoming_ms = 0;
};

/// Negotiate effective intervals from the client's offer and the server's CONNECTED header
HeartbeatIntervals NegotiateHeartbeat(const HeartbeatCadence& client, const HeartbeatCadence& server);

} // namespace stomp

#endif // STOMP_HEARTBEAT_HPP
