#ifndef STOMP_EVENTS_HPP
#define STOMP_EVENTS_HPP

#include "header_map.hpp"

#include <functional>
#include <string>

namespace stomp {

/// Events emitted by the Client
enum class Event {
    SendFrame,
    Connected,
    Message,
    Receipt,
    Error,
    Disconnected,
    ProtocolError
};

inline const char* ToString(Event event) {
    switch (event) {
        case Event::SendFrame: return "SEND_FRAME";
        case Event::Connected: return "CONNECTED";
        case Event::Message: return "MESSAGE";
        case Event::Receipt: return "RECEIPT";
        case Event::Error: return "ERROR";
        case Event::Disconnected: return "DISCONNECTED";
        case Event::ProtocolError: return "PROTOCOL_ERROR";
    }
    return "UNKNOWN";
}

// Listener signatures, one per event
using SendFrameListener = std::function<void(const std::string& raw_frame)>;
using ConnectedListener = std::function<void(const HeaderMap& headers)>;
using MessageListener = std::function<void(const HeaderMap& headers, const std::string& body)>;
using ReceiptListener = std::function<void(const HeaderMap& headers)>;
using ErrorListener = std::function<void(const HeaderMap& headers, const std::string& body)>;
using DisconnectedListener = std::function<void()>;
using ProtocolErrorListener = std::function<void(int code, const std::string& message)>;

} // namespace stomp

#endif // STOMP_EVENTS_HPP
