/**
 * AudioCues.cpp - Tone generation and playback
 *
 * Listening: rising 400 -> 800 Hz. Processing: falling 800 -> 500 Hz.
 * Thinking and speaking are short soft blips; error is a low falling tone.
 */

#include "parley/audio/AudioCues.hpp"

#include <cmath>
#include <exception>
#include <iostream>

namespace parley::audio {

namespace {

constexpr double kTwoPi = 6.283185307179586;

const char* cueName(Cue cue) {
    switch (cue) {
        case Cue::Listening:  return "listening";
        case Cue::Processing: return "processing";
        case Cue::Thinking:   return "thinking";
        case Cue::Speaking:   return "speaking";
        case Cue::Error:      return "error";
    }
    return "unknown";
}

} // anonymous namespace

AudioCues::AudioCues(AudioEngine& engine)
    : engine_(engine)
{
}

std::vector<float> AudioCues::sweep(float start_hz, float end_hz, float seconds,
                                    float peak, float fade_in, float fade_out,
                                    int sample_rate) {
    const size_t n = static_cast<size_t>(seconds * static_cast<float>(sample_rate));
    std::vector<float> tone(n);
    if (n == 0) return tone;

    const size_t in_len = static_cast<size_t>(fade_in * static_cast<float>(n));
    const size_t out_len = static_cast<size_t>(fade_out * static_cast<float>(n));

    double phase = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double progress = static_cast<double>(i) / static_cast<double>(n);
        const double freq = start_hz + (end_hz - start_hz) * progress;
        phase += kTwoPi * freq / sample_rate;

        double gain = peak;
        if (in_len > 0 && i < in_len) {
            gain = peak * static_cast<double>(i) / static_cast<double>(in_len);
        } else if (out_len > 0 && i >= n - out_len) {
            gain = peak * static_cast<double>(n - 1 - i) / static_cast<double>(out_len);
        }

        tone[i] = static_cast<float>(std::sin(phase) * gain);
    }

    return tone;
}

std::vector<float> AudioCues::render(Cue cue) {
    switch (cue) {
        case Cue::Listening:  return sweep(400.0f, 800.0f, 0.40f, 0.80f, 0.33f, 0.33f);
        case Cue::Processing: return sweep(800.0f, 500.0f, 0.35f, 0.75f, 0.25f, 0.50f);
        case Cue::Thinking:   return sweep(600.0f, 600.0f, 0.12f, 0.35f, 0.20f, 0.50f);
        case Cue::Speaking:   return sweep(700.0f, 900.0f, 0.10f, 0.35f, 0.20f, 0.50f);
        case Cue::Error:      return sweep(330.0f, 220.0f, 0.30f, 0.70f, 0.10f, 0.40f);
    }
    return {};
}

void AudioCues::play(Cue cue) {
    try {
        auto tone = render(cue);
        if (!engine_.play(tone.data(), tone.size(), kCueSampleRate)) {
            std::cerr << "[AudioCues] Could not play " << cueName(cue) << " cue: "
                      << engine_.lastError() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[AudioCues] " << cueName(cue) << " cue failed: " << e.what() << std::endl;
    }
}

} // namespace parley::audio
