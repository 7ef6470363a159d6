#include "frame_codec.hpp"
#include "header_codec.hpp"
#include "stomp/types.hpp"
#include <charconv>

namespace stomp {
namespace internal {

namespace {
    constexpr const char* CONTENT_LENGTH = "content-length";

    std::optional<size_t> ParseContentLength(const std::string& value) {
        size_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return length;
    }
}

std::string FrameCodec::Encode(const Frame& frame) {
    const Command command = frame.GetCommand();

    // CONNECT precedes escape negotiation and is sent verbatim
    std::string header_block = (command == Command::Connect)
        ? HeaderCodec::ToString(frame.GetHeaders())
        : HeaderCodec::ToString(HeaderCodec::EncodeHeaders(frame.GetHeaders()));

    std::string buffer;
    buffer.reserve(header_block.size() + frame.GetBody().size() + 16);

    buffer += ToString(command);
    buffer += protocol::EOL;
    if (!header_block.empty()) {
        buffer += header_block;
        buffer += protocol::EOL;
    }
    buffer += protocol::EOL;
    if (command == Command::Send) {
        buffer += frame.GetBody();
    }
    buffer += protocol::NUL;

    return buffer;
}

FrameDecoder::FrameDecoder(size_t capacity)
    : buffer_(capacity)
    , stage_(Stage::Command)
    , scan_offset_(0)
    , frame_size_(0)
    , frame_error_(error_code::SUCCESS)
{}

size_t FrameDecoder::Feed(const uint8_t* data, size_t size) {
    return buffer_.Append(data, size);
}

size_t FrameDecoder::GetBufferedSize() const {
    return buffer_.Size();
}

void FrameDecoder::Reset() {
    buffer_.Clear();
    stage_ = Stage::Command;
    scan_offset_ = 0;
    frame_size_ = 0;
    command_name_.clear();
    command_.reset();
    header_block_.clear();
    headers_ = HeaderMap{};
    content_length_.reset();
    body_.clear();
    frame_error_ = error_code::SUCCESS;
    frame_error_message_.clear();
}

std::optional<FrameDecoder::Result> FrameDecoder::Next() {
    while (true) {
        bool progressed = false;

        switch (stage_) {
            case Stage::Command: {
                auto line = ReadLine();
                if (!line) {
                    break;
                }
                if (line->empty()) {
                    frame_size_ = 0;
                    return Result{ResultKind::Heartbeat, std::nullopt, error_code::SUCCESS, {}};
                }
                BeginFrame(*line);
                progressed = true;
                break;
            }

            case Stage::Headers: {
                auto line = ReadLine();
                if (!line) {
                    break;
                }
                if (line->empty()) {
                    EndHeaders();
                } else {
                    header_block_ += *line;
                    header_block_ += protocol::EOL;
                    CheckOverflow(frame_size_);
                }
                progressed = true;
                break;
            }

            case Stage::Body:
                progressed = ReadBody();
                break;

            case Stage::Terminator:
                if (buffer_.Size() == 0) {
                    break;
                }
                if (buffer_.At(0) == static_cast<uint8_t>(protocol::NUL)) {
                    buffer_.Discard(1);
                } else {
                    SetFrameError(error_code::MISSING_FRAME_TERMINATOR,
                                  "Frame body of " + command_name_ + " is not followed by NUL");
                }
                return FinishFrame();
        }

        if (!progressed) {
            CheckOverflow(frame_size_ + buffer_.Size() + 1);
            return std::nullopt;
        }
    }
}

std::optional<std::string> FrameDecoder::ReadLine() {
    size_t eol = buffer_.Find(static_cast<uint8_t>(protocol::EOL), scan_offset_);
    if (eol == RingBuffer::NPOS) {
        scan_offset_ = buffer_.Size();
        return std::nullopt;
    }

    std::string line = buffer_.Take(eol);
    buffer_.Discard(1);
    scan_offset_ = 0;
    frame_size_ += eol + 1;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void FrameDecoder::BeginFrame(const std::string& command_line) {
    command_name_ = command_line;
    command_ = ParseCommand(command_line);
    if (command_ && !IsServerCommand(*command_)) {
        command_.reset();
    }

    header_block_.clear();
    headers_ = HeaderMap{};
    content_length_.reset();
    body_.clear();
    frame_error_ = error_code::SUCCESS;
    frame_error_message_.clear();
    stage_ = Stage::Headers;
}

void FrameDecoder::EndHeaders() {
    HeaderMap raw = HeaderCodec::FromString(header_block_);
    header_block_.clear();

    if (command_ == Command::Connected) {
        // CONNECTED headers are never escaped
        headers_ = std::move(raw);
    } else {
        try {
            headers_ = HeaderCodec::DecodeHeaders(raw);
        } catch (const ProtocolError& e) {
            // The frame is dropped, but its body must still be skipped
            headers_ = raw;
            SetFrameError(e.code(), e.what());
        }
    }

    if (const std::string* value = headers_.Find(CONTENT_LENGTH)) {
        content_length_ = ParseContentLength(*value);
        if (!content_length_) {
            SetFrameError(error_code::INVALID_CONTENT_LENGTH,
                          "Invalid content-length '" + *value + "' in " + command_name_ + " frame");
        } else if (*content_length_ >= buffer_.Capacity()) {
            CheckOverflow(buffer_.Capacity() + 1);
        } else {
            CheckOverflow(frame_size_ + *content_length_ + 1);
        }
    }

    stage_ = Stage::Body;
}

bool FrameDecoder::ReadBody() {
    size_t length = 0;

    if (content_length_) {
        // Binary-safe: exactly content-length bytes, NUL included
        length = *content_length_;
        if (buffer_.Size() < length) {
            return false;
        }
    } else {
        length = buffer_.Find(static_cast<uint8_t>(protocol::NUL), scan_offset_);
        if (length == RingBuffer::NPOS) {
            scan_offset_ = buffer_.Size();
            return false;
        }
    }

    body_ = buffer_.Take(length);
    frame_size_ += length;
    scan_offset_ = 0;
    stage_ = Stage::Terminator;
    return true;
}

FrameDecoder::Result FrameDecoder::FinishFrame() {
    stage_ = Stage::Command;
    scan_offset_ = 0;
    frame_size_ = 0;

    if (!command_) {
        return Result{ResultKind::Dropped, std::nullopt, error_code::SUCCESS,
                      "Unsupported command '" + command_name_ + "'"};
    }

    if (frame_error_ != error_code::SUCCESS) {
        return Result{ResultKind::Dropped, std::nullopt, frame_error_, frame_error_message_};
    }

    return Result{ResultKind::Frame,
                  Frame(*command_, std::move(headers_), std::move(body_)),
                  error_code::SUCCESS, {}};
}

void FrameDecoder::SetFrameError(int code, std::string message) {
    // Keep the first error of a frame
    if (frame_error_ == error_code::SUCCESS) {
        frame_error_ = code;
        frame_error_message_ = std::move(message);
    }
}

void FrameDecoder::CheckOverflow(size_t required) const {
    if (required > buffer_.Capacity()) {
        throw ProtocolError(error_code::BUFFER_OVERFLOW,
                            "Frame exceeds receive buffer of " +
                            std::to_string(buffer_.Capacity()) + " bytes");
    }
}

} // namespace internal
} // namespace stomp
