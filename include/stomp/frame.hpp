#ifndef STOMP_FRAME_HPP
#define STOMP_FRAME_HPP

#include "header_map.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace stomp {

/// STOMP 1.2 frame commands handled by this client
enum class Command {
    Connect,
    Connected,
    Subscribe,
    Unsubscribe,
    Send,
    Message,
    Ack,
    Nack,
    Disconnect,
    Receipt,
    Error
};

/// Wire name of a command, e.g. "SEND"
const char* ToString(Command command);

/// Parse a wire command name (exact, case-sensitive)
std::optional<Command> ParseCommand(std::string_view name);

/// True for commands a broker sends to a client (CONNECTED, MESSAGE, RECEIPT, ERROR)
bool IsServerCommand(Command command);

/// Frame representing one STOMP message on the wire
class Frame {
public:
    explicit Frame(Command command, HeaderMap headers = {}, std::string body = {});

    Command GetCommand() const { return command_; }

    const HeaderMap& GetHeaders() const { return headers_; }

    /// Body bytes; binary-safe, may contain NUL
    const std::string& GetBody() const { return body_; }

private:
    Command command_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace stomp

#endif // STOMP_FRAME_HPP
