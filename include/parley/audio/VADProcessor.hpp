/**
 * VADProcessor.hpp - Voice activity detection and utterance endpointing
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace parley::audio {

/// libfvad aggressiveness; higher rejects more non-speech.
enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

/// Called once per completed speech segment.
using SpeechCallback = std::function<void(const std::vector<float>& samples, int duration_ms)>;

/**
 * Accumulates samples into 10/20/30 ms analysis frames, classifies each one and
 * tracks the current speech segment. A segment ends after the silence timeout.
 *
 * If libfvad cannot be created for the requested rate, frames are classified
 * by mean absolute amplitude against kFallbackThreshold instead.
 */
class VADProcessor {
public:
    static constexpr float kFallbackThreshold = 0.01f;

    explicit VADProcessor(int sample_rate = 16000,
                          VADMode mode = VADMode::Aggressive,
                          int frame_ms = 30);
    ~VADProcessor();

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    void process(const float* samples, size_t count);

    void setSpeechCallback(SpeechCallback callback);
    void setSilenceTimeout(int timeout_ms);
    void setMinSpeechDuration(int min_ms);

    bool isSpeaking() const;
    int currentSpeechDuration() const;

    /// Take the partial segment collected so far and reset segment state.
    std::vector<float> drainSpeech();

    bool usingFvad() const;

    void reset();

private:
    void processFrame();

    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace parley::audio
