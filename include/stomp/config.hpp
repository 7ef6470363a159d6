#ifndef STOMP_CONFIG_HPP
#define STOMP_CONFIG_HPP

#include "types.hpp"

#include <cstdint>
#include <string>

namespace stomp {

/// Configuration for the Client
struct ClientConfig {
    /// Offered heart-beat cadence "cx,cy" in milliseconds (default: "0,0")
    std::string heartbeat = protocol::DEFAULT_HEARTBEAT;

    /// Grace period added to the negotiated incoming interval (default: 1s)
    uint32_t heartbeat_margin_ms = protocol::HEARTBEAT_MARGIN_MS;

    /// Credentials sent in the CONNECT frame when non-empty
    std::string login;
    std::string passcode;

    /// Value of the CONNECT "host" header (default: the connect host)
    std::string virtual_host;

    /// Receive buffer size in bytes; bounds the largest decodable frame (default: 1MB)
    uint32_t receive_buffer_size = protocol::DEFAULT_RECEIVE_BUFFER_SIZE;

    /// Use SSL/TLS encryption for the default TCP transport
    bool use_ssl = false;

    /// Skip server certificate validation (self-signed test certs)
    bool skip_server_certificate_validation = false;
};

} // namespace stomp

#endif // STOMP_CONFIG_HPP
