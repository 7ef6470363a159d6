#include "tcp_transport.hpp"
#include <deque>
#include <iostream>
#include <stdexcept>
#include <vector>

#if defined(STOMP_USE_BOOST_ASIO)
    #include <boost/asio/ssl.hpp>
#else
    #include <asio/ssl.hpp>
#endif

namespace stomp {
namespace internal {

class TcpTransport::Impl : public std::enable_shared_from_this<TcpTransport::Impl> {
public:
    enum class State { Idle, Connecting, Open, Closing, Closed };

    asio::ip::tcp::resolver resolver_;
    asio::ssl::context ssl_context_;
    asio::ip::tcp::socket socket_;
    std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket>> ssl_stream_;
    State state_;
    bool writing_;
    std::deque<std::string> write_queue_;
    std::vector<uint8_t> receive_buffer_;
    std::function<void(bool, std::string)> connect_callback_;
    std::function<void(const uint8_t*, size_t)> receive_callback_;
    std::function<void(std::string)> error_callback_;

    Impl(asio::io_context& io_context, bool use_ssl, bool skip_server_certificate_validation)
        : resolver_(io_context)
        , ssl_context_(asio::ssl::context::tls_client)
        , socket_(io_context)
        , state_(State::Idle)
        , writing_(false)
        , receive_buffer_(8192)  // 8KB receive buffer
    {
        if (use_ssl) {
            if (skip_server_certificate_validation) {
                ssl_context_.set_verify_mode(asio::ssl::verify_none);
            } else {
                ssl_context_.set_default_verify_paths();
                ssl_context_.set_verify_mode(asio::ssl::verify_peer);
            }
            ssl_stream_ = std::make_unique<asio::ssl::stream<asio::ip::tcp::socket>>(io_context, ssl_context_);
        }
    }

    asio::ip::tcp::socket& LowestLayer() {
        return ssl_stream_ ? ssl_stream_->next_layer() : socket_;
    }

    /// Run an operation on the plain socket or the TLS stream
    template <typename Operation>
    void WithStream(Operation&& operation) {
        if (ssl_stream_) {
            operation(*ssl_stream_);
        } else {
            operation(socket_);
        }
    }

    void Connect(const std::string& host, uint16_t port) {
        state_ = State::Connecting;
        auto self = shared_from_this();

        resolver_.async_resolve(
            host,
            std::to_string(port),
            [self, host](const AsioErrorCode& resolve_error,
                         const asio::ip::tcp::resolver::results_type& endpoints) {
                if (self->state_ != State::Connecting) {
                    return;
                }
                if (resolve_error) {
                    self->FailConnect("Resolve " + host + " failed: " + resolve_error.message());
                    return;
                }

                asio::async_connect(
                    self->LowestLayer(),
                    endpoints,
                    [self, host](const AsioErrorCode& connect_error, const asio::ip::tcp::endpoint&) {
                        if (self->state_ != State::Connecting) {
                            return;
                        }
                        if (connect_error) {
                            self->FailConnect("Connect to " + host + " failed: " + connect_error.message());
                            return;
                        }
                        if (self->ssl_stream_) {
                            self->StartHandshake(host);
                        } else {
                            self->CompleteConnect();
                        }
                    }
                );
            }
        );
    }

    void StartHandshake(const std::string& host) {
        // SNI for brokers behind virtual hosting
        SSL_set_tlsext_host_name(ssl_stream_->native_handle(), host.c_str());

        auto self = shared_from_this();
        ssl_stream_->async_handshake(
            asio::ssl::stream_base::client,
            [self](const AsioErrorCode& handshake_error) {
                if (self->state_ != State::Connecting) {
                    return;
                }
                if (handshake_error) {
                    self->FailConnect("TLS handshake failed: " + handshake_error.message());
                    return;
                }
                self->CompleteConnect();
            }
        );
    }

    void CompleteConnect() {
        state_ = State::Open;
        StartReceive();

        auto callback = std::move(connect_callback_);
        connect_callback_ = nullptr;
        if (callback) {
            callback(true, {});
        }
    }

    void FailConnect(const std::string& reason) {
        CloseSocket();
        state_ = State::Closed;

        auto callback = std::move(connect_callback_);
        ClearCallbacks();
        if (callback) {
            callback(false, reason);
        }
    }

    void StartReceive() {
        auto self = shared_from_this();
        WithStream([self](auto& stream) {
            stream.async_read_some(
                asio::buffer(self->receive_buffer_),
                [self](const AsioErrorCode& error, size_t bytes_transferred) {
                    if (self->state_ != State::Open) {
                        return;
                    }
                    if (error) {
                        self->HandleError("Receive failed: " + error.message());
                        return;
                    }

                    // Copy: the callback may close this transport
                    auto callback = self->receive_callback_;
                    if (callback) {
                        callback(self->receive_buffer_.data(), bytes_transferred);
                    }
                    if (self->state_ == State::Open) {
                        self->StartReceive();  // Continue receiving
                    }
                }
            );
        });
    }

    bool Write(std::string data) {
        if (state_ != State::Open) {
            return false;
        }

        write_queue_.push_back(std::move(data));
        if (!writing_) {
            DoWrite();
        }
        return true;
    }

    void DoWrite() {
        writing_ = true;
        auto self = shared_from_this();
        WithStream([self](auto& stream) {
            asio::async_write(
                stream,
                asio::buffer(self->write_queue_.front()),
                [self](const AsioErrorCode& error, size_t) {
                    self->writing_ = false;
                    if (self->state_ == State::Closed) {
                        return;
                    }
                    if (error) {
                        if (self->state_ == State::Closing) {
                            self->FinishClose();
                        } else {
                            self->HandleError("Send failed: " + error.message());
                        }
                        return;
                    }

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) {
                        self->DoWrite();
                    } else if (self->state_ == State::Closing) {
                        self->FinishClose();
                    }
                }
            );
        });
    }

    void Close() {
        ClearCallbacks();

        switch (state_) {
            case State::Open:
                if (writing_) {
                    // Flush queued frames (e.g. DISCONNECT) before shutting down
                    state_ = State::Closing;
                    return;
                }
                FinishClose();
                return;
            case State::Connecting:
                resolver_.cancel();
                FinishClose();
                return;
            case State::Closing:
                return;
            case State::Idle:
            case State::Closed:
                state_ = State::Closed;
                return;
        }
    }

    void FinishClose() {
        state_ = State::Closed;
        write_queue_.clear();
        CloseSocket();
    }

    void CloseSocket() {
        AsioErrorCode ec;
        auto& socket = LowestLayer();
        if (socket.is_open()) {
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    void HandleError(const std::string& reason) {
        if (state_ != State::Open) {
            return;  // Already closing, avoid double callback
        }
        std::cerr << "Transport error: " << reason << std::endl;

        FinishClose();
        auto callback = std::move(error_callback_);  // Move to avoid use-after-free
        ClearCallbacks();
        if (callback) {
            callback(reason);
        }
    }

    void ClearCallbacks() {
        connect_callback_ = nullptr;
        receive_callback_ = nullptr;
        error_callback_ = nullptr;
    }
};

TcpTransport::TcpTransport(asio::io_context& io_context, bool use_ssl, bool skip_server_certificate_validation)
    : impl_(std::make_shared<Impl>(io_context, use_ssl, skip_server_certificate_validation))
{}

TcpTransport::~TcpTransport() {
    impl_->Close();
}

void TcpTransport::Connect(const std::string& host, uint16_t port) {
    if (impl_->state_ != Impl::State::Idle) {
        throw std::runtime_error("Transport already used");
    }
    impl_->Connect(host, port);
}

bool TcpTransport::Write(std::string data) {
    return impl_->Write(std::move(data));
}

void TcpTransport::Close() {
    impl_->Close();
}

bool TcpTransport::IsOpen() const {
    return impl_->state_ == Impl::State::Open;
}

void TcpTransport::SetConnectCallback(std::function<void(bool success, std::string reason)> callback) {
    impl_->connect_callback_ = std::move(callback);
}

void TcpTransport::SetReceiveCallback(std::function<void(const uint8_t*, size_t)> callback) {
    impl_->receive_callback_ = std::move(callback);
}

void TcpTransport::SetErrorCallback(std::function<void(std::string reason)> callback) {
    impl_->error_callback_ = std::move(callback);
}

} // namespace internal
} // namespace stomp
