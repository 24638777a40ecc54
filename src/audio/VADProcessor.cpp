/**
 * VADProcessor.cpp - Voice Activity Detection via libfvad
 *
 * Classifies fixed analysis frames as speech or silence and closes a segment
 * once the configured run of silence follows speech.
 */

#include "parley/audio/VADProcessor.hpp"

#include <fvad.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

namespace parley::audio {

struct VADProcessor::Impl {
    Fvad* vad = nullptr;

    int sample_rate;
    int frame_ms;
    int frame_samples;

    std::vector<float> frameBuffer;
    std::vector<int16_t> frame16;

    std::vector<float> speechBuffer;
    bool inSpeech = false;
    int speechFrames = 0;
    int silenceFrames = 0;

    int silenceTimeoutMs = 1200;
    int minSpeechDurationMs = 200;
    int silenceTimeoutFrames = 0;
    int minSpeechFrames = 0;

    SpeechCallback callback;

    void updateThresholds() {
        silenceTimeoutFrames = std::max(1, silenceTimeoutMs / frame_ms);
        minSpeechFrames = std::max(1, minSpeechDurationMs / frame_ms);
    }

    bool classify() {
        if (!vad) {
            float sum = 0.0f;
            for (float s : frameBuffer) {
                sum += std::fabs(s);
            }
            return sum / static_cast<float>(frameBuffer.size()) > kFallbackThreshold;
        }

        for (int i = 0; i < frame_samples; ++i) {
            float sample = std::clamp(frameBuffer[i], -1.0f, 1.0f);
            frame16[i] = static_cast<int16_t>(sample * 32767.0f);
        }

        int result = fvad_process(vad, frame16.data(), static_cast<size_t>(frame_samples));
        if (result < 0) {
            std::cerr << "[VADProcessor] fvad_process failed, frame treated as silence" << std::endl;
            return false;
        }
        return result == 1;
    }

    void clearSegment() {
        speechBuffer.clear();
        inSpeech = false;
        speechFrames = 0;
        silenceFrames = 0;
    }
};

VADProcessor::VADProcessor(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->frame_ms = frame_ms;
    pImpl_->frame_samples = (sample_rate * frame_ms) / 1000;

    pImpl_->frameBuffer.reserve(pImpl_->frame_samples);
    pImpl_->frame16.resize(pImpl_->frame_samples);
    pImpl_->speechBuffer.reserve(static_cast<size_t>(sample_rate) * 30);

    pImpl_->updateThresholds();

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VADProcessor] Failed to create fvad instance, using amplitude threshold" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[VADProcessor] Invalid sample rate for fvad: " << sample_rate
                  << ", using amplitude threshold" << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VADProcessor] Invalid mode" << std::endl;
    }

    std::cout << "[VADProcessor] Initialized (sample_rate=" << sample_rate
              << "Hz, frame=" << frame_ms << "ms, mode=" << static_cast<int>(mode) << ")"
              << std::endl;
}

VADProcessor::~VADProcessor() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

void VADProcessor::process(const float* samples, size_t count) {
    if (pImpl_->frame_samples <= 0) return;

    for (size_t i = 0; i < count; ++i) {
        pImpl_->frameBuffer.push_back(samples[i]);

        if (pImpl_->frameBuffer.size() >= static_cast<size_t>(pImpl_->frame_samples)) {
            processFrame();
        }
    }
}

void VADProcessor::processFrame() {
    auto& impl = *pImpl_;
    const bool isSpeech = impl.classify();

    if (isSpeech) {
        impl.speechBuffer.insert(impl.speechBuffer.end(), impl.frameBuffer.begin(), impl.frameBuffer.end());
        impl.inSpeech = true;
        impl.speechFrames++;
        impl.silenceFrames = 0;
    } else if (impl.inSpeech) {
        // Trailing silence stays in the segment (brief pauses)
        impl.speechBuffer.insert(impl.speechBuffer.end(), impl.frameBuffer.begin(), impl.frameBuffer.end());
        impl.silenceFrames++;

        if (impl.silenceFrames >= impl.silenceTimeoutFrames) {
            if (impl.speechFrames >= impl.minSpeechFrames && impl.callback) {
                int duration_ms = static_cast<int>(impl.speechBuffer.size()) * 1000 / impl.sample_rate;
                impl.callback(impl.speechBuffer, duration_ms);
            }
            impl.clearSegment();
        }
    }

    impl.frameBuffer.clear();
}

void VADProcessor::setSpeechCallback(SpeechCallback callback) {
    pImpl_->callback = std::move(callback);
}

void VADProcessor::setSilenceTimeout(int timeout_ms) {
    pImpl_->silenceTimeoutMs = timeout_ms;
    pImpl_->updateThresholds();
}

void VADProcessor::setMinSpeechDuration(int min_ms) {
    pImpl_->minSpeechDurationMs = min_ms;
    pImpl_->updateThresholds();
}

bool VADProcessor::isSpeaking() const {
    return pImpl_->inSpeech;
}

int VADProcessor::currentSpeechDuration() const {
    return static_cast<int>(pImpl_->speechBuffer.size()) * 1000 / pImpl_->sample_rate;
}

std::vector<float> VADProcessor::drainSpeech() {
    std::vector<float> speech;
    speech.swap(pImpl_->speechBuffer);
    pImpl_->clearSegment();
    return speech;
}

bool VADProcessor::usingFvad() const {
    return pImpl_->vad != nullptr;
}

void VADProcessor::reset() {
    pImpl_->frameBuffer.clear();
    pImpl_->clearSegment();

    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
    }
}

} // namespace parley::audio
