/**
 * MicrophoneRecorder.cpp - Utterance capture with libfvad endpointing
 */

#include "parley/audio/MicrophoneRecorder.hpp"
#include "parley/audio/VADProcessor.hpp"
#include "parley/core/FrameStream.hpp"

#include <iostream>

namespace parley::audio {

MicrophoneRecorder::MicrophoneRecorder(AudioFrameSource& source, RecorderOptions options)
    : source_(source)
    , options_(options)
{
}

CapturedUtterance MicrophoneRecorder::record() {
    CapturedUtterance utterance;
    utterance.sample_rate = options_.sample_rate;

    core::ScopedFrameStream stream(&source_, "Recorder");
    if (!stream.isOpen()) {
        return utterance;
    }

    VADProcessor vad(options_.sample_rate);
    vad.setSilenceTimeout(options_.silence_ms);
    vad.setMinSpeechDuration(options_.min_speech_ms);

    bool complete = false;
    vad.setSpeechCallback([&](const std::vector<float>& samples, int duration_ms) {
        utterance.samples = samples;
        complete = true;
        std::cout << "[Recorder] Utterance captured (" << duration_ms << "ms)" << std::endl;
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options_.max_seconds);

    while (!complete && std::chrono::steady_clock::now() < deadline) {
        auto frame = source_.nextFrame(options_.poll_interval);
        if (frame && !frame->empty()) {
            vad.process(frame->data(), frame->size());
        }
    }

    if (!complete) {
        utterance.samples = vad.drainSpeech();
        if (!utterance.samples.empty()) {
            std::cout << "[Recorder] Max duration reached (" << options_.max_seconds << "s)" << std::endl;
        } else {
            std::cout << "[Recorder] No speech detected" << std::endl;
        }
    }

    return utterance;
}

} // namespace parley::audio
