/**
 * RingBuffer.hpp - Lock-free single-producer / single-consumer sample buffer
 *
 * Feeds the PortAudio output callback without taking locks on the audio thread.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <vector>

namespace parley::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1)
    {
    }

    /// Producer side. Returns the number of elements actually written.
    size_t push(const T* data, size_t count) {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t read = read_.load(std::memory_order_acquire);
        const size_t space = freeSpace(read, write);
        const size_t n = std::min(count, space);

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % buffer_.size()] = data[i];
        }

        write_.store((write + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    /// Consumer side. Returns the number of elements actually read.
    size_t pop(T* out, size_t count) {
        const size_t read = read_.load(std::memory_order_relaxed);
        const size_t write = write_.load(std::memory_order_acquire);
        const size_t n = std::min(count, used(read, write));

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % buffer_.size()];
        }

        read_.store((read + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    size_t available() const {
        return used(read_.load(std::memory_order_acquire), write_.load(std::memory_order_acquire));
    }

    size_t capacity() const { return buffer_.size() - 1; }

    /// Drop everything queued. Consumer-side operation.
    void clear() {
        read_.store(write_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    size_t used(size_t read, size_t write) const {
        return (write + buffer_.size() - read) % buffer_.size();
    }

    size_t freeSpace(size_t read, size_t write) const {
        return capacity() - used(read, write);
    }

    std::vector<T> buffer_;
    std::atomic<size_t> read_{0};
    std::atomic<size_t> write_{0};
};

} // namespace parley::audio
