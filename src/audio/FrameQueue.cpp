/**
 * FrameQueue.cpp - Bounded frame channel implementation
 */

#include "parley/audio/FrameQueue.hpp"

#include <utility>

namespace parley::audio {

FrameQueue::FrameQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

void FrameQueue::push(AudioFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            dropped_++;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
}

std::optional<AudioFrame> FrameQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !frames_.empty(); })) {
        return std::nullopt;
    }

    AudioFrame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void FrameQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

size_t FrameQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace parley::audio
