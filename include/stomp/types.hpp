#ifndef STOMP_TYPES_HPP
#define STOMP_TYPES_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace stomp {

// Type aliases
using TimerHandle = uint64_t;
using ListenerId = uint64_t;

// Error codes
namespace error_code {
    constexpr int SUCCESS = 0;
    constexpr int INVALID_HEADER_ESCAPE = 2003;
    constexpr int BUFFER_OVERFLOW = 2004;
    constexpr int INVALID_CONTENT_LENGTH = 2005;
    constexpr int MISSING_FRAME_TERMINATOR = 2006;
    constexpr int INVALID_HEARTBEAT = 2007;
}

// Protocol constants
namespace protocol {
    constexpr const char* VERSION = "1.2";
    constexpr uint16_t DEFAULT_PORT = 61613;
    constexpr const char* DEFAULT_HEARTBEAT = "0,0";
    constexpr uint32_t HEARTBEAT_MARGIN_MS = 1000;
    constexpr uint32_t DEFAULT_RECEIVE_BUFFER_SIZE = 1024 * 1024;  // 1MB
    constexpr char EOL = '\n';
    constexpr char NUL = '\0';
}

/// Subscription acknowledgment mode
enum class AckMode {
    Auto,
    Client,
    ClientIndividual
};

inline const char* ToString(AckMode mode) {
    switch (mode) {
        case AckMode::Client: return "client";
        case AckMode::ClientIndividual: return "client-individual";
        case AckMode::Auto: break;
    }
    return "auto";
}

/// Session lifecycle; Disconnected is terminal for a Client instance
enum class ConnectionState {
    Unconnected,
    Connecting,
    Connected,
    Disconnected
};

inline const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Unconnected: return "Unconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

/// Local protocol violation detected while encoding or decoding
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

} // namespace stomp

#endif // STOMP_TYPES_HPP
