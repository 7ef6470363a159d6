#ifndef STOMP_HEADER_CODEC_HPP
#define STOMP_HEADER_CODEC_HPP

#include "stomp/header_map.hpp"
#include <string>
#include <string_view>

namespace stomp {
namespace internal {

/// HeaderCodec handles STOMP 1.2 header escaping and the "name:value" line block
class HeaderCodec {
public:
    /// Escape backslash, CR, LF and colon as \\ \r \n \c (single pass)
    static std::string Escape(std::string_view text);

    /// Reverse Escape()
    /// @throws ProtocolError (INVALID_HEADER_ESCAPE) on an unknown or truncated escape
    static std::string Unescape(std::string_view text);

    /// Escape every header name and value
    static HeaderMap EncodeHeaders(const HeaderMap& headers);

    /// Unescape every header name and value
    /// @throws ProtocolError (INVALID_HEADER_ESCAPE)
    static HeaderMap DecodeHeaders(const HeaderMap& headers);

    /// Join headers as "name:value" lines separated by LF (no trailing LF)
    static std::string ToString(const HeaderMap& headers);

    /// Parse a header block; CR before LF is ignored, lines without a colon
    /// are skipped and a repeated name keeps its first value
    static HeaderMap FromString(std::string_view block);
};

} // namespace internal
} // namespace stomp

#endif // STOMP_HEADER_CODEC_HPP
