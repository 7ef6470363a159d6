#ifndef STOMP_TCP_TRANSPORT_HPP
#define STOMP_TCP_TRANSPORT_HPP

#include "stomp/asio.hpp"
#include "stomp/transport.hpp"
#include <memory>

namespace stomp {
namespace internal {

/// TCP (optionally TLS) transport running on a caller-owned io_context
class TcpTransport : public ITransport {
public:
    explicit TcpTransport(asio::io_context& io_context,
                          bool use_ssl = false,
                          bool skip_server_certificate_validation = false);
    ~TcpTransport();

    // Delete copy operations
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void Connect(const std::string& host, uint16_t port) override;
    bool Write(std::string data) override;
    void Close() override;
    bool IsOpen() const override;

    void SetConnectCallback(std::function<void(bool success, std::string reason)> callback) override;
    void SetReceiveCallback(std::function<void(const uint8_t*, size_t)> callback) override;
    void SetErrorCallback(std::function<void(std::string reason)> callback) override;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_TCP_TRANSPORT_HPP
