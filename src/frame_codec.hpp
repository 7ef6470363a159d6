#ifndef STOMP_FRAME_CODEC_HPP
#define STOMP_FRAME_CODEC_HPP

#include "ring_buffer.hpp"
#include "stomp/frame.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace stomp {
namespace internal {

/// FrameCodec encodes outbound frames
class FrameCodec {
public:
    /// Encode a frame to its wire bytes
    /// Format: COMMAND LF (name:value LF)* LF [BODY] NUL
    /// Headers are escaped except on CONNECT; only SEND carries a body.
    static std::string Encode(const Frame& frame);
};

/// Incremental decoder for broker-to-client frames
/// Bytes may arrive in chunks of any size; each Next() call yields at most
/// one heartbeat or frame in stream order.
class FrameDecoder {
public:
    enum class ResultKind {
        Heartbeat,  // a lone EOL between frames
        Frame,      // a complete, valid server frame
        Dropped     // a complete frame that is discarded (error_code says why, 0 = unsupported command)
    };

    struct Result {
        ResultKind kind;
        std::optional<Frame> frame;
        int error_code = 0;
        std::string message;
    };

    /// @param capacity Receive buffer size; bounds the largest frame
    explicit FrameDecoder(size_t capacity);

    /// Buffer incoming bytes
    /// @return Number of bytes accepted (less than size when the buffer is full)
    size_t Feed(const uint8_t* data, size_t size);

    /// Decode the next heartbeat or frame from buffered bytes
    /// @return std::nullopt when more bytes are needed
    /// @throws ProtocolError (BUFFER_OVERFLOW) when a frame cannot fit in the buffer
    std::optional<Result> Next();

    /// Get number of buffered, not yet decoded bytes
    size_t GetBufferedSize() const;

    /// Drop buffered bytes and any partially decoded frame
    void Reset();

private:
    enum class Stage { Command, Headers, Body, Terminator };

    std::optional<std::string> ReadLine();
    void BeginFrame(const std::string& command_line);
    void EndHeaders();
    bool ReadBody();
    Result FinishFrame();
    void SetFrameError(int code, std::string message);
    void CheckOverflow(size_t required) const;

    RingBuffer buffer_;
    Stage stage_;
    size_t scan_offset_;
    size_t frame_size_;  // Bytes of the current frame already taken from buffer_

    std::string command_name_;
    std::optional<Command> command_;
    std::string header_block_;
    HeaderMap headers_;
    std::optional<size_t> content_length_;
    std::string body_;
    int frame_error_;
    std::string frame_error_message_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_FRAME_CODEC_HPP
