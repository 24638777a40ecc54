/**
 * FollowUpListener.cpp - Follow-up speech detection with a hard deadline
 */

#include "parley/core/FollowUpListener.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace parley::core {

FollowUpListener::FollowUpListener(AudioFrameSource* source, ListenerOptions options)
    : source_(source)
    , options_(options)
{
}

bool FollowUpListener::listen(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;

    ScopedFrameStream stream(source_, "FollowUp");
    if (!stream.isOpen()) {
        // No input: still block for the whole window
        std::this_thread::sleep_until(deadline);
        return false;
    }

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        auto wait = std::min(remaining, options_.poll_interval);

        std::optional<AudioFrame> frame;
        try {
            frame = source_->nextFrame(wait);
        } catch (const std::exception& e) {
            std::cerr << "[FollowUp] Audio input failed: " << e.what() << std::endl;
            stream.close();
            std::this_thread::sleep_until(deadline);
            return false;
        }

        if (frame && meanAbsoluteAmplitude(*frame) > options_.threshold) {
            std::cout << "[FollowUp] Speech detected" << std::endl;
            return true;
        }
    }
}

} // namespace parley::core
