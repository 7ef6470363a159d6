#ifndef STOMP_RING_BUFFER_HPP
#define STOMP_RING_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stomp {
namespace internal {

/// Bounded byte queue holding received, not yet decoded stream data
/// Bytes leave in arrival order; storage wraps around so no data is moved.
class RingBuffer {
public:
    static constexpr size_t NPOS = static_cast<size_t>(-1);

    /// @throws std::invalid_argument if capacity is 0
    explicit RingBuffer(size_t capacity);

    size_t Size() const { return size_; }
    size_t Capacity() const { return storage_.size(); }
    size_t Available() const { return storage_.size() - size_; }
    bool Full() const { return size_ == storage_.size(); }

    /// Append as many bytes as fit
    /// @return Number of bytes appended
    size_t Append(const uint8_t* data, size_t size);

    /// Byte at offset from the oldest buffered byte
    uint8_t At(size_t offset) const;

    /// Offset of the first byte equal to value, searching from offset
    /// @return NPOS if not buffered yet
    size_t Find(uint8_t value, size_t offset = 0) const;

    /// Remove and return the oldest size bytes
    std::string Take(size_t size);

    /// Drop the oldest size bytes
    void Discard(size_t size);

    void Clear();

private:
    size_t Wrap(size_t position) const { return position % storage_.size(); }

    std::vector<uint8_t> storage_;
    size_t start_;  // Oldest byte
    size_t size_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_RING_BUFFER_HPP
