/**
 * FrameQueue.hpp - Bounded frame channel between the audio driver and its reader
 */

#pragma once

#include "parley/Types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace parley::audio {

/**
 * Multi-producer / single-consumer queue of audio frames.
 * push() never blocks: when full, the oldest frame is dropped.
 */
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity = 64);

    void push(AudioFrame frame);

    /// Wait up to timeout for a frame.
    std::optional<AudioFrame> pop(std::chrono::milliseconds timeout);

    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dropped() const;

private:
    size_t capacity_;
    std::deque<AudioFrame> frames_;
    size_t dropped_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace parley::audio
