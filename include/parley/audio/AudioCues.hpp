/**
 * AudioCues.hpp - Synthesized earcons for each pipeline stage
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/audio/AudioEngine.hpp"

#include <vector>

namespace parley::audio {

class AudioCues : public AudioFeedback {
public:
    static constexpr int kCueSampleRate = 22050;

    explicit AudioCues(AudioEngine& engine);

    /// Blocking. Playback failures are logged, never thrown.
    void play(Cue cue) override;

    /// Rendered clip for a cue at kCueSampleRate.
    static std::vector<float> render(Cue cue);

    /**
     * Linear frequency sweep with a fade-in / sustain / fade-out envelope.
     * fade_in and fade_out are fractions of the clip length.
     */
    static std::vector<float> sweep(float start_hz, float end_hz, float seconds,
                                    float peak, float fade_in, float fade_out,
                                    int sample_rate = kCueSampleRate);

private:
    AudioEngine& engine_;
};

} // namespace parley::audio
