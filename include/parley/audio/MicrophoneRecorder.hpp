/**
 * MicrophoneRecorder.hpp - VAD-endpointed utterance capture
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <chrono>

namespace parley::audio {

struct RecorderOptions {
    int sample_rate = kDefaultSampleRate;
    int max_seconds = 30;
    int silence_ms = 1200;
    int min_speech_ms = 200;
    std::chrono::milliseconds poll_interval{100};
};

/**
 * Records from the frame source until a speech segment closes on trailing
 * silence, or until max_seconds have elapsed. A microphone that cannot be
 * opened yields an empty utterance.
 */
class MicrophoneRecorder : public AudioRecorder {
public:
    MicrophoneRecorder(AudioFrameSource& source, RecorderOptions options = {});

    CapturedUtterance record() override;

private:
    AudioFrameSource& source_;
    RecorderOptions options_;
};

} // namespace parley::audio
