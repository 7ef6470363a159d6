#include "stomp/frame.hpp"

#include <array>
#include <utility>

namespace stomp {

namespace {
    struct CommandName {
        Command command;
        std::string_view name;
    };

    constexpr std::array<CommandName, 11> COMMAND_NAMES = {{
        {Command::Connect, "CONNECT"},
        {Command::Connected, "CONNECTED"},
        {Command::Subscribe, "SUBSCRIBE"},
        {Command::Unsubscribe, "UNSUBSCRIBE"},
        {Command::Send, "SEND"},
        {Command::Message, "MESSAGE"},
        {Command::Ack, "ACK"},
        {Command::Nack, "NACK"},
        {Command::Disconnect, "DISCONNECT"},
        {Command::Receipt, "RECEIPT"},
        {Command::Error, "ERROR"},
    }};
}

const char* ToString(Command command) {
    for (const auto& entry : COMMAND_NAMES) {
        if (entry.command == command) {
            return entry.name.data();
        }
    }
    return "UNKNOWN";
}

std::optional<Command> ParseCommand(std::string_view name) {
    for (const auto& entry : COMMAND_NAMES) {
        if (entry.name == name) {
            return entry.command;
        }
    }
    return std::nullopt;
}

bool IsServerCommand(Command command) {
    switch (command) {
        case Command::Connected:
        case Command::Message:
        case Command::Receipt:
        case Command::Error:
            return true;
        default:
            return false;
    }
}

Frame::Frame(Command command, HeaderMap headers, std::string body)
    : command_(command)
    , headers_(std::move(headers))
    , body_(std::move(body))
{}

} // namespace stomp
