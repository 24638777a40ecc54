/**
 * MicrophoneFrameSource.cpp - Microphone frame regrouping
 */

#include "parley/audio/MicrophoneFrameSource.hpp"

#include <iostream>

namespace parley::audio {

MicrophoneFrameSource::MicrophoneFrameSource(AudioEngine& engine,
                                             size_t frame_samples,
                                             size_t queue_capacity)
    : engine_(engine)
    , frame_samples_(frame_samples == 0 ? kDefaultFrameSamples : frame_samples)
    , queue_(queue_capacity)
{
    pending_.reserve(frame_samples_);
}

MicrophoneFrameSource::~MicrophoneFrameSource() {
    close();
}

bool MicrophoneFrameSource::open() {
    queue_.clear();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.clear();
    }

    if (!engine_.openInput([this](const float* samples, size_t count) {
            onSamples(samples, count);
        })) {
        std::cerr << "[Microphone] Unavailable: " << engine_.lastError() << std::endl;
        return false;
    }
    open_ = true;
    return true;
}

std::optional<AudioFrame> MicrophoneFrameSource::nextFrame(std::chrono::milliseconds timeout) {
    return queue_.pop(timeout);
}

void MicrophoneFrameSource::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    engine_.closeInput();
    queue_.clear();
}

void MicrophoneFrameSource::onSamples(const float* samples, size_t count) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (size_t i = 0; i < count; ++i) {
        pending_.push_back(samples[i]);
        if (pending_.size() >= frame_samples_) {
            queue_.push(std::move(pending_));
            pending_ = AudioFrame();
            pending_.reserve(frame_samples_);
        }
    }
}

} // namespace parley::audio
