#include "stomp/heartbeat.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string_view>

namespace stomp {

namespace {
    std::string_view Trim(std::string_view value) {
        const char* whitespace = " \t";
        size_t first = value.find_first_not_of(whitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        size_t last = value.find_last_not_of(whitespace);
        return value.substr(first, last - first + 1);
    }

    uint32_t ParseMillis(std::string_view token, const std::string& whole) {
        token = Trim(token);
        uint32_t result = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
        if (token.empty() || ec != std::errc() || ptr != token.data() + token.size()) {
            throw std::invalid_argument("Invalid heart-beat value: '" + whole + "'");
        }
        return result;
    }
}

HeartbeatCadence HeartbeatCadence::Parse(const std::string& value) {
    std::string_view view(value);
    size_t comma = view.find(',');
    if (comma == std::string_view::npos) {
        throw std::invalid_argument("Invalid heart-beat value: '" + value + "'");
    }

    HeartbeatCadence cadence;
    cadence.send_ms = ParseMillis(view.substr(0, comma), value);
    cadence.receive_ms = ParseMillis(view.substr(comma + 1), value);
    return cadence;
}

std::string HeartbeatCadence::ToString() const {
    return std::to_string(send_ms) + "," + std::to_string(receive_ms);
}

HeartbeatIntervals NegotiateHeartbeat(const HeartbeatCadence& client, const HeartbeatCadence& server) {
    HeartbeatIntervals intervals;

    // Each direction is off when either side opts out
    if (client.send_ms != 0 && server.receive_ms != 0) {
        intervals.outgoing_ms = std::max(client.send_ms, server.receive_ms);
    }
    if (server.send_ms != 0 && client.receive_ms != 0) {
        intervals.incoming_ms = std::max(server.send_ms, client.receive_ms);
    }

    return intervals;
}

} // namespace stomp
