/**
 * PcmUtils.hpp - WAV encoding, decoding and sample-rate conversion
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parley::audio {

struct PcmClip {
    std::vector<float> samples;   // mono
    int sample_rate = 0;
};

/**
 * Decode an in-memory RIFF/WAVE file. Supports 16-bit integer PCM and 32-bit
 * IEEE float; multi-channel input is averaged down to mono.
 * @param error receives a short reason when decoding fails
 */
std::optional<PcmClip> decodeWav(const std::vector<uint8_t>& bytes, std::string* error = nullptr);

/// 16-bit PCM mono WAV; samples are clamped to [-1, 1].
std::vector<uint8_t> encodeWav16(const std::vector<float>& samples, int sample_rate);

/// Linear interpolation resampler.
std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate);

} // namespace parley::audio
