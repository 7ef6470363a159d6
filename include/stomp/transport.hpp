#ifndef STOMP_TRANSPORT_HPP
#define STOMP_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace stomp {

/// Bidirectional byte stream the client speaks STOMP over
/// Implementations report through callbacks and must not invoke any
/// callback after Close() has been called.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start connecting; the connect callback reports the outcome
    virtual void Connect(const std::string& host, uint16_t port) = 0;

    /// Queue bytes for writing in call order
    /// @return false if the transport is not open (nothing is written)
    virtual bool Write(std::string data) = 0;

    /// Flush queued bytes, then close the stream
    virtual void Close() = 0;

    /// Check if the stream is connected and not closed
    virtual bool IsOpen() const = 0;

    virtual void SetConnectCallback(std::function<void(bool success, std::string reason)> callback) = 0;
    virtual void SetReceiveCallback(std::function<void(const uint8_t*, size_t)> callback) = 0;

    /// Fired once on a read/write failure of an open stream
    virtual void SetErrorCallback(std::function<void(std::string reason)> callback) = 0;
};

} // namespace stomp

#endif // STOMP_TRANSPORT_HPP
