#include "ring_buffer.hpp"
#include <algorithm>
#include <stdexcept>

namespace stomp {
namespace internal {

RingBuffer::RingBuffer(size_t capacity)
    : storage_(capacity)
    , start_(0)
    , size_(0)
{
    if (capacity == 0) {
        throw std::invalid_argument("Ring buffer capacity must be positive");
    }
}

size_t RingBuffer::Append(const uint8_t* data, size_t size) {
    size_t accepted = std::min(size, Available());

    // Up to two segments: the tail of storage, then its front
    size_t end = Wrap(start_ + size_);
    size_t first = std::min(accepted, storage_.size() - end);
    std::copy_n(data, first, storage_.begin() + end);
    std::copy_n(data + first, accepted - first, storage_.begin());

    size_ += accepted;
    return accepted;
}

uint8_t RingBuffer::At(size_t offset) const {
    if (offset >= size_) {
        throw std::out_of_range("Ring buffer offset " + std::to_string(offset) +
                                " beyond " + std::to_string(size_) + " buffered bytes");
    }
    return storage_[Wrap(start_ + offset)];
}

size_t RingBuffer::Find(uint8_t value, size_t offset) const {
    for (size_t i = offset; i < size_; ++i) {
        if (storage_[Wrap(start_ + i)] == value) {
            return i;
        }
    }
    return NPOS;
}

std::string RingBuffer::Take(size_t size) {
    if (size > size_) {
        throw std::out_of_range("Cannot take " + std::to_string(size) +
                                " bytes from " + std::to_string(size_) + " buffered");
    }

    std::string result;
    result.reserve(size);
    size_t first = std::min(size, storage_.size() - start_);
    result.append(storage_.begin() + start_, storage_.begin() + start_ + first);
    result.append(storage_.begin(), storage_.begin() + (size - first));

    Discard(size);
    return result;
}

void RingBuffer::Discard(size_t size) {
    if (size > size_) {
        throw std::out_of_range("Cannot discard more bytes than buffered");
    }
    start_ = Wrap(start_ + size);
    size_ -= size;
}

void RingBuffer::Clear() {
    start_ = 0;
    size_ = 0;
}

} // namespace internal
} // namespace stomp
