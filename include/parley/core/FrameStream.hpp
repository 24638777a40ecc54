/**
 * FrameStream.hpp - Frame energy measure and scoped access to an AudioFrameSource
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <cmath>

namespace parley::core {

/// Default gate on mean absolute amplitude, normalized [-1, 1] scale.
constexpr float kSpeechEnergyThreshold = 0.02f;

inline float meanAbsoluteAmplitude(const AudioFrame& frame) {
    if (frame.empty()) return 0.0f;

    double sum = 0.0;
    for (float sample : frame) {
        sum += std::fabs(sample);
    }
    return static_cast<float>(sum / static_cast<double>(frame.size()));
}

/**
 * Opens a frame source on construction and closes it on destruction.
 * A null source, a failed open() or a throwing open() all leave the stream
 * closed; the failure is logged under the given tag.
 */
class ScopedFrameStream {
public:
    ScopedFrameStream(AudioFrameSource* source, const char* tag);
    ~ScopedFrameStream();

    ScopedFrameStream(const ScopedFrameStream&) = delete;
    ScopedFrameStream& operator=(const ScopedFrameStream&) = delete;

    bool isOpen() const { return open_; }

    /// Close early; the destructor then does nothing.
    void close();

private:
    AudioFrameSource* source_;
    const char* tag_;
    bool open_ = false;
};

} // namespace parley::core
