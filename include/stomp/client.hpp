#ifndef STOMP_CLIENT_HPP
#define STOMP_CLIENT_HPP

#include "asio.hpp"
#include "config.hpp"
#include "events.hpp"
#include "header_map.hpp"
#include "heartbeat.hpp"
#include "timer_service.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace stomp {

/// STOMP 1.2 client session
/// Event-driven: every callback runs on the io_context (or collaborators)
/// driving the client, and the API must be called from that same thread.
/// One Client serves one session; once Disconnected, create a new Client.
class Client {
public:
    /// Client over the default TCP transport and asio timers
    explicit Client(asio::io_context& io_context, ClientConfig config = {});

    /// Client over caller-supplied collaborators
    Client(std::unique_ptr<ITransport> transport,
           std::unique_ptr<ITimerService> timers,
           ClientConfig config = {});

    /// Destructor; disconnects without notifying listeners
    ~Client();

    // Delete copy operations
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Connect to the broker using the configured heart-beat cadence
    /// @throws std::runtime_error if Connect was already called
    void Connect(const std::string& host, uint16_t port = protocol::DEFAULT_PORT);

    /// Connect offering an explicit heart-beat cadence "cx,cy"
    /// @throws std::invalid_argument if client_heartbeat is malformed
    void Connect(const std::string& host, uint16_t port, const std::string& client_heartbeat);

    /// Send DISCONNECT and tear the session down without waiting for the receipt
    void Disconnect();

    /// Check if a CONNECTED frame was received and the session is still alive
    bool IsConnected() const;

    ConnectionState GetState() const;

    /// Subscribe to a destination
    /// A destination already subscribed keeps its subscription and nothing is sent.
    /// @param id Subscription id; a random one is generated when omitted
    /// @return The subscription id in effect for the destination
    std::string Subscribe(const std::string& destination,
                          AckMode ack_mode = AckMode::Auto,
                          std::optional<std::string> id = std::nullopt);

    /// Send UNSUBSCRIBE for a subscription id (tracked or not)
    void Unsubscribe(const std::string& id);

    /// Send a message; content-length and destination headers are filled in
    void Send(const std::string& destination, HeaderMap headers = {}, const std::string& body = {});

    /// Acknowledge a message by its ack id
    void Ack(const std::string& msg_id);

    /// Reject a message by its ack id
    void Nack(const std::string& msg_id);

    // Session information from the CONNECTED frame
    const std::string& GetSessionId() const;
    const std::string& GetVersion() const;
    const std::string& GetServer() const;
    HeartbeatIntervals GetHeartbeatIntervals() const;

    /// Subscription id tracked for a destination, if any
    std::optional<std::string> GetSubscriptionId(const std::string& destination) const;

    // Listener registration; each event fans out to every registered listener
    ListenerId OnSendFrame(SendFrameListener listener);
    ListenerId OnConnected(ConnectedListener listener);
    ListenerId OnMessage(MessageListener listener);
    ListenerId OnReceipt(ReceiptListener listener);
    ListenerId OnError(ErrorListener listener);
    ListenerId OnDisconnected(DisconnectedListener listener);
    ListenerId OnProtocolError(ProtocolErrorListener listener);

    /// Remove a listener registered with any On* method
    /// @return true if a listener was removed
    bool RemoveListener(ListenerId id);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace stomp

#endif // STOMP_CLIENT_HPP
