/**
 * FollowUpListener.hpp - Bounded wait for the user to keep talking
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/core/FrameStream.hpp"

#include <chrono>

namespace parley::core {

struct ListenerOptions {
    float threshold = kSpeechEnergyThreshold;
    std::chrono::milliseconds poll_interval{50};
};

class FollowUpListener {
public:
    explicit FollowUpListener(AudioFrameSource* source, ListenerOptions options = {});

    /**
     * Watch the microphone until speech energy appears or the timeout elapses.
     * Without a usable input the full timeout is still waited out.
     * @return true as soon as a frame exceeds the threshold
     */
    bool listen(std::chrono::milliseconds timeout);

private:
    AudioFrameSource* source_;
    ListenerOptions options_;
};

} // namespace parley::core
