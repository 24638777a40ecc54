/**
 * PcmUtils.cpp - WAV parsing and writing, linear resampling
 *
 * The header is walked chunk by chunk: "fmt " may be larger than 16 bytes and
 * servers often insert LIST chunks before "data".
 */

#include "parley/audio/PcmUtils.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace parley::audio {

namespace {

uint16_t readU16(const std::vector<uint8_t>& b, size_t offset) {
    return static_cast<uint16_t>(b[offset] | (b[offset + 1] << 8));
}

uint32_t readU32(const std::vector<uint8_t>& b, size_t offset) {
    return static_cast<uint32_t>(b[offset])
         | (static_cast<uint32_t>(b[offset + 1]) << 8)
         | (static_cast<uint32_t>(b[offset + 2]) << 16)
         | (static_cast<uint32_t>(b[offset + 3]) << 24);
}

bool tagAt(const std::vector<uint8_t>& b, size_t offset, const char* tag) {
    return std::memcmp(&b[offset], tag, 4) == 0;
}

void writeU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void writeU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void writeTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

std::optional<PcmClip> fail(std::string* error, const char* reason) {
    if (error) *error = reason;
    return std::nullopt;
}

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

} // anonymous namespace

std::optional<PcmClip> decodeWav(const std::vector<uint8_t>& bytes, std::string* error) {
    if (bytes.size() < 12 || !tagAt(bytes, 0, "RIFF") || !tagAt(bytes, 8, "WAVE")) {
        return fail(error, "no RIFF/WAVE header");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;

    size_t data_offset = 0;
    size_t data_size = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint32_t chunk_size = readU32(bytes, pos + 4);
        const size_t body = pos + 8;

        if (tagAt(bytes, pos, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return fail(error, "truncated fmt chunk");
            }
            format = readU16(bytes, body);
            channels = readU16(bytes, body + 2);
            rate = readU32(bytes, body + 4);
            bits = readU16(bytes, body + 14);
            if (format == kFormatExtensible && chunk_size >= 26 && body + 26 <= bytes.size()) {
                format = readU16(bytes, body + 24);   // sub-format GUID starts with the format code
            }
            have_fmt = true;
        } else if (tagAt(bytes, pos, "data")) {
            data_offset = body;
            // Streaming servers may leave the size as 0 or 0xFFFFFFFF
            data_size = std::min<size_t>(chunk_size, bytes.size() - body);
            if (chunk_size == 0) data_size = bytes.size() - body;
            break;
        }

        pos = body + chunk_size + (chunk_size & 1u);
    }

    if (!have_fmt) return fail(error, "no fmt chunk");
    if (data_offset == 0) return fail(error, "no data chunk");
    if (channels == 0 || rate == 0) return fail(error, "invalid fmt chunk");

    PcmClip clip;
    clip.sample_rate = static_cast<int>(rate);

    const size_t bytes_per_sample = bits / 8;
    if (!((format == kFormatPcm && bits == 16) || (format == kFormatFloat && bits == 32))) {
        return fail(error, "unsupported sample format");
    }

    const size_t frame_bytes = bytes_per_sample * channels;
    const size_t frames = data_size / frame_bytes;
    clip.samples.reserve(frames);

    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            const size_t at = data_offset + f * frame_bytes + c * bytes_per_sample;
            if (bits == 16) {
                const auto raw = static_cast<int16_t>(readU16(bytes, at));
                sum += static_cast<float>(raw) / 32768.0f;
            } else {
                float value;
                const uint32_t raw = readU32(bytes, at);
                std::memcpy(&value, &raw, sizeof(value));
                sum += value;
            }
        }
        clip.samples.push_back(sum / static_cast<float>(channels));
    }

    return clip;
}

std::vector<uint8_t> encodeWav16(const std::vector<float>& samples, int sample_rate) {
    const auto rate = static_cast<uint32_t>(sample_rate);
    const auto data_size = static_cast<uint32_t>(samples.size() * 2);

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);
    writeTag(out, "RIFF");
    writeU32(out, 36 + data_size);
    writeTag(out, "WAVE");

    writeTag(out, "fmt ");
    writeU32(out, 16);
    writeU16(out, kFormatPcm);
    writeU16(out, 1);
    writeU32(out, rate);
    writeU32(out, rate * 2);
    writeU16(out, 2);
    writeU16(out, 16);

    writeTag(out, "data");
    writeU32(out, data_size);
    for (float sample : samples) {
        const float clamped = std::clamp(sample, -1.0f, 1.0f);
        const auto value = static_cast<int16_t>(std::lround(clamped * 32767.0f));
        writeU16(out, static_cast<uint16_t>(value));
    }

    return out;
}

std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }

    double ratio = static_cast<double>(to_rate) / from_rate;
    size_t new_size = static_cast<size_t>(samples.size() * ratio);
    std::vector<float> resampled(new_size);

    for (size_t i = 0; i < new_size; i++) {
        double src_pos = i / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            resampled[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else if (idx < samples.size()) {
            resampled[i] = samples[idx];
        }
    }

    return resampled;
}

} // namespace parley::audio
