#include "stomp/client.hpp"
#include "asio_timer_service.hpp"
#include "event_dispatcher.hpp"
#include "frame_codec.hpp"
#include "heartbeat_monitor.hpp"
#include "subscription_registry.hpp"
#include "tcp_transport.hpp"
#include "stomp/frame.hpp"
#include <iostream>
#include <random>
#include <stdexcept>

namespace stomp {

class Client::Impl {
public:
    ClientConfig config_;
    std::unique_ptr<ITimerService> timers_;
    std::unique_ptr<ITransport> transport_;
    internal::EventDispatcher events_;
    internal::FrameDecoder decoder_;
    internal::SubscriptionRegistry subscriptions_;
    internal::HeartbeatMonitor heartbeat_;
    std::mt19937 random_;

    ConnectionState state_;
    std::string host_;
    uint16_t port_;
    HeartbeatCadence client_heartbeat_;
    std::string session_id_;
    std::string version_;
    std::string server_;

    Impl(std::unique_ptr<ITransport> transport, std::unique_ptr<ITimerService> timers, ClientConfig config)
        : config_(std::move(config))
        , timers_(std::move(timers))
        , transport_(std::move(transport))
        , decoder_(config_.receive_buffer_size)
        , heartbeat_(*timers_,
                     [this]() { SendHeartbeat(); },
                     [this]() { OnHeartbeatTimeout(); },
                     config_.heartbeat_margin_ms)
        , random_(std::random_device{}())
        , state_(ConnectionState::Unconnected)
        , port_(0)
    {
        transport_->SetConnectCallback([this](bool success, std::string reason) {
            OnTransportConnected(success, reason);
        });

        transport_->SetReceiveCallback([this](const uint8_t* data, size_t size) {
            OnDataReceived(data, size);
        });

        transport_->SetErrorCallback([this](std::string reason) {
            OnTransportError(reason);
        });
    }

    bool IsSessionActive() const {
        return state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected;
    }

    void Connect(const std::string& host, uint16_t port, const std::string& client_heartbeat) {
        if (state_ != ConnectionState::Unconnected) {
            throw std::runtime_error("Client already connected once; create a new Client to reconnect");
        }

        client_heartbeat_ = HeartbeatCadence::Parse(client_heartbeat);
        host_ = host;
        port_ = port;
        state_ = ConnectionState::Connecting;
        transport_->Connect(host, port);
    }

    void OnTransportConnected(bool success, const std::string& reason) {
        if (state_ != ConnectionState::Connecting) {
            return;
        }

        if (!success) {
            std::cerr << "Connection to " << host_ << ":" << port_ << " failed: " << reason << std::endl;
            Teardown();
            return;
        }

        HeaderMap headers{
            {"accept-version", protocol::VERSION},
            {"host", config_.virtual_host.empty() ? host_ : config_.virtual_host},
            {"heart-beat", client_heartbeat_.ToString()},
        };
        if (!config_.login.empty()) {
            headers.Add("login", config_.login);
        }
        if (!config_.passcode.empty()) {
            headers.Add("passcode", config_.passcode);
        }

        WriteFrame(Frame(Command::Connect, std::move(headers)));
    }

    // Frames are decoded and dispatched one at a time so a listener that
    // ends the session stops dispatch of anything still buffered.
    void OnDataReceived(const uint8_t* data, size_t size) {
        if (!IsSessionActive()) {
            return;
        }

        // Any byte from the broker proves liveness
        heartbeat_.ResetIncoming();

        try {
            size_t offset = 0;
            while (IsSessionActive()) {
                offset += decoder_.Feed(data + offset, size - offset);

                while (IsSessionActive()) {
                    auto result = decoder_.Next();
                    if (!result) {
                        break;
                    }
                    HandleDecoded(std::move(*result));
                }

                if (offset == size) {
                    break;
                }
            }
        } catch (const ProtocolError& e) {
            std::cerr << "Fatal protocol error: " << e.what() << std::endl;
            events_.EmitProtocolError(e.code(), e.what());
            Teardown();
        }
    }

    void HandleDecoded(internal::FrameDecoder::Result result) {
        using ResultKind = internal::FrameDecoder::ResultKind;

        switch (result.kind) {
            case ResultKind::Heartbeat:
                break;

            case ResultKind::Dropped:
                // Unsupported commands are dropped silently
                if (result.error_code != error_code::SUCCESS) {
                    std::cerr << "Dropping frame: " << result.message << std::endl;
                    events_.EmitProtocolError(result.error_code, result.message);
                }
                break;

            case ResultKind::Frame:
                Dispatch(*result.frame);
                break;
        }
    }

    void Dispatch(const Frame& frame) {
        const HeaderMap& headers = frame.GetHeaders();

        switch (frame.GetCommand()) {
            case Command::Connected:
                if (state_ != ConnectionState::Connecting) {
                    std::cerr << "Ignoring unexpected CONNECTED frame" << std::endl;
                    return;
                }
                OnConnectedFrame(headers);
                events_.EmitConnected(headers);
                break;

            case Command::Message:
                events_.EmitMessage(headers, frame.GetBody());
                break;

            case Command::Receipt:
                events_.EmitReceipt(headers);
                break;

            case Command::Error:
                events_.EmitError(headers, frame.GetBody());
                break;

            default:
                break;
        }
    }

    void OnConnectedFrame(const HeaderMap& headers) {
        state_ = ConnectionState::Connected;
        session_id_ = headers.GetOr("session");
        version_ = headers.GetOr("version");
        server_ = headers.GetOr("server");

        HeartbeatCadence server_heartbeat;
        try {
            server_heartbeat = HeartbeatCadence::Parse(headers.GetOr("heart-beat", protocol::DEFAULT_HEARTBEAT));
        } catch (const std::invalid_argument& e) {
            // An unreadable server cadence disables heart-beating both ways
            std::cerr << "Ignoring server heart-beat: " << e.what() << std::endl;
            events_.EmitProtocolError(error_code::INVALID_HEARTBEAT, e.what());
        }

        heartbeat_.Start(NegotiateHeartbeat(client_heartbeat_, server_heartbeat));
    }

    void OnTransportError(const std::string& reason) {
        if (!IsSessionActive()) {
            return;
        }
        std::cerr << "Connection to " << host_ << ":" << port_ << " lost: " << reason << std::endl;
        Teardown();
    }

    void OnHeartbeatTimeout() {
        if (!IsSessionActive()) {
            return;
        }
        std::cerr << "No data from " << host_ << ":" << port_ << " within "
                  << heartbeat_.GetIntervals().incoming_ms << "ms heart-beat window" << std::endl;
        Teardown();
    }

    void SendHeartbeat() {
        if (!transport_->Write(std::string(1, protocol::EOL))) {
            std::cerr << "Heart-beat not sent: transport closed" << std::endl;
            return;
        }
        heartbeat_.ResetOutgoing();
    }

    /// Cancel timers, close the transport and fire DISCONNECTED exactly once
    void Teardown() {
        if (state_ == ConnectionState::Disconnected) {
            return;
        }
        state_ = ConnectionState::Disconnected;

        heartbeat_.Stop();
        transport_->Close();
        decoder_.Reset();
        subscriptions_.Clear();

        events_.EmitDisconnected();
    }

    void RequireOpen(Command command) const {
        if (!IsSessionActive() || !transport_->IsOpen()) {
            throw std::runtime_error(std::string("Cannot send ") + ToString(command) + ": not connected");
        }
    }

    void WriteFrame(const Frame& frame) {
        std::string encoded = internal::FrameCodec::Encode(frame);
        events_.EmitSendFrame(encoded);

        if (!transport_->Write(std::move(encoded))) {
            std::cerr << "Dropping " << ToString(frame.GetCommand()) << " frame: transport closed" << std::endl;
            return;
        }

        // Real traffic counts as a heart-beat
        heartbeat_.ResetOutgoing();
    }

    std::string GenerateId() {
        std::uniform_int_distribution<uint32_t> distribution;
        return std::to_string(distribution(random_));
    }

    std::string Subscribe(const std::string& destination, AckMode ack_mode, std::optional<std::string> id) {
        if (const auto* existing = subscriptions_.FindByDestination(destination)) {
            return existing->id;
        }

        RequireOpen(Command::Subscribe);

        std::string subscription_id;
        if (id) {
            if (subscriptions_.ContainsId(*id)) {
                throw std::invalid_argument("Subscription id '" + *id + "' already in use");
            }
            subscription_id = *id;
        } else {
            do {
                subscription_id = GenerateId();
            } while (subscriptions_.ContainsId(subscription_id));
        }

        subscriptions_.Add({destination, subscription_id, ack_mode});
        WriteFrame(Frame(Command::Subscribe, {
            {"destination", destination},
            {"id", subscription_id},
            {"ack", ToString(ack_mode)},
        }));

        return subscription_id;
    }

    void Disconnect() {
        if (!IsSessionActive()) {
            return;
        }

        if (transport_->IsOpen()) {
            // Teardown does not wait for the RECEIPT
            WriteFrame(Frame(Command::Disconnect, {{"receipt", GenerateId()}}));
        }
        Teardown();
    }
};

Client::Client(asio::io_context& io_context, ClientConfig config)
    : Client(std::make_unique<internal::TcpTransport>(io_context, config.use_ssl,
                                                      config.skip_server_certificate_validation),
             std::make_unique<internal::AsioTimerService>(io_context),
             config)
{}

Client::Client(std::unique_ptr<ITransport> transport, std::unique_ptr<ITimerService> timers, ClientConfig config) {
    if (!transport || !timers) {
        throw std::invalid_argument("Client requires a transport and a timer service");
    }
    impl_ = std::make_unique<Impl>(std::move(transport), std::move(timers), std::move(config));
}

Client::~Client() {
    // Listeners may already be gone; disconnect silently
    impl_->events_.Clear();
    impl_->Disconnect();
}

void Client::Connect(const std::string& host, uint16_t port) {
    impl_->Connect(host, port, impl_->config_.heartbeat);
}

void Client::Connect(const std::string& host, uint16_t port, const std::string& client_heartbeat) {
    impl_->Connect(host, port, client_heartbeat);
}

void Client::Disconnect() {
    impl_->Disconnect();
}

bool Client::IsConnected() const {
    return impl_->state_ == ConnectionState::Connected;
}

ConnectionState Client::GetState() const {
    return impl_->state_;
}

std::string Client::Subscribe(const std::string& destination, AckMode ack_mode, std::optional<std::string> id) {
    return impl_->Subscribe(destination, ack_mode, std::move(id));
}

void Client::Unsubscribe(const std::string& id) {
    impl_->RequireOpen(Command::Unsubscribe);
    impl_->subscriptions_.RemoveById(id);
    impl_->WriteFrame(Frame(Command::Unsubscribe, {{"id", id}}));
}

void Client::Send(const std::string& destination, HeaderMap headers, const std::string& body) {
    impl_->RequireOpen(Command::Send);

    if (!headers.Contains("content-length")) {
        headers.Set("content-length", std::to_string(body.size()));
    }
    headers.Set("destination", destination);

    impl_->WriteFrame(Frame(Command::Send, std::move(headers), body));
}

void Client::Ack(const std::string& msg_id) {
    impl_->RequireOpen(Command::Ack);
    impl_->WriteFrame(Frame(Command::Ack, {{"id", msg_id}}));
}

void Client::Nack(const std::string& msg_id) {
    impl_->RequireOpen(Command::Nack);
    impl_->WriteFrame(Frame(Command::Nack, {{"id", msg_id}}));
}

const std::string& Client::GetSessionId() const {
    return impl_->session_id_;
}

const std::string& Client::GetVersion() const {
    return impl_->version_;
}

const std::string& Client::GetServer() const {
    return impl_->server_;
}

HeartbeatIntervals Client::GetHeartbeatIntervals() const {
    return impl_->heartbeat_.GetIntervals();
}

std::optional<std::string> Client::GetSubscriptionId(const std::string& destination) const {
    if (const auto* subscription = impl_->subscriptions_.FindByDestination(destination)) {
        return subscription->id;
    }
    return std::nullopt;
}

ListenerId Client::OnSendFrame(SendFrameListener listener) {
    return impl_->events_.OnSendFrame(std::move(listener));
}

ListenerId Client::OnConnected(ConnectedListener listener) {
    return impl_->events_.OnConnected(std::move(listener));
}

ListenerId Client::OnMessage(MessageListener listener) {
    return impl_->events_.OnMessage(std::move(listener));
}

ListenerId Client::OnReceipt(ReceiptListener listener) {
    return impl_->events_.OnReceipt(std::move(listener));
}

ListenerId Client::OnError(ErrorListener listener) {
    return impl_->events_.OnError(std::move(listener));
}

ListenerId Client::OnDisconnected(DisconnectedListener listener) {
    return impl_->events_.OnDisconnected(std::move(listener));
}

ListenerId Client::OnProtocolError(ProtocolErrorListener listener) {
    return impl_->events_.OnProtocolError(std::move(listener));
}

bool Client::RemoveListener(ListenerId id) {
    return impl_->events_.Remove(id);
}

} // namespace stomp
