/**
 * PorcupineWakeWordDetector.cpp - Porcupine wake word detection
 */

#include "parley/wakeword/PorcupineWakeWordDetector.hpp"
#include "parley/core/FrameStream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

// Porcupine C API
extern "C" {
#include "pv_porcupine.h"
}

namespace parley::wakeword {

struct PorcupineWakeWordDetector::Impl {
    pv_porcupine_t* porcupine = nullptr;
    int frame_length = 512;
    bool ready = false;
    std::vector<int16_t> accumulator;

    explicit Impl(const PorcupineOptions& options) {
        if (options.keyword_paths.empty()) {
            std::cerr << "[WakeWord] No keyword paths provided" << std::endl;
            return;
        }

        std::vector<const char*> kw_paths;
        for (const auto& p : options.keyword_paths) {
            kw_paths.push_back(p.c_str());
        }

        std::vector<float> sens = options.sensitivities;
        sens.resize(options.keyword_paths.size(), 0.5f);

        pv_status_t status = pv_porcupine_init(
            options.access_key.c_str(),
            options.model_path.c_str(),
            "cpu",
            static_cast<int32_t>(options.keyword_paths.size()),
            kw_paths.data(),
            sens.data(),
            &porcupine
        );

        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[WakeWord] Failed to initialize Porcupine: "
                      << pv_status_to_string(status) << std::endl;
            porcupine = nullptr;
            return;
        }

        frame_length = pv_porcupine_frame_length();
        accumulator.reserve(static_cast<size_t>(frame_length) * 2);
        ready = true;

        std::cout << "[WakeWord] Porcupine initialized (version: "
                  << pv_porcupine_version()
                  << ", frame_length: " << frame_length << ")" << std::endl;
    }

    ~Impl() {
        if (porcupine) {
            pv_porcupine_delete(porcupine);
        }
    }

    int process(const int16_t* samples) {
        int32_t keyword_index = -1;
        pv_status_t status = pv_porcupine_process(porcupine, samples, &keyword_index);

        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[WakeWord] Process error: " << pv_status_to_string(status) << std::endl;
            return -1;
        }
        return keyword_index;
    }
};

PorcupineWakeWordDetector::PorcupineWakeWordDetector(AudioFrameSource& source,
                                                     const PorcupineOptions& options,
                                                     const std::atomic<bool>& running)
    : source_(source)
    , running_(running)
    , impl_(std::make_unique<Impl>(options))
{
}

PorcupineWakeWordDetector::~PorcupineWakeWordDetector() = default;

bool PorcupineWakeWordDetector::awaitWake() {
    if (!impl_->ready) {
        std::cerr << "[WakeWord] Porcupine not ready" << std::endl;
        return false;
    }

    core::ScopedFrameStream stream(&source_, "WakeWord");
    if (!stream.isOpen()) {
        return false;
    }

    impl_->accumulator.clear();
    std::cout << "[WakeWord] Listening for wake word..." << std::endl;

    while (running_) {
        auto frame = source_.nextFrame(std::chrono::milliseconds(100));
        if (!frame || frame->empty()) {
            continue;
        }

        int keyword = processFloat(frame->data(), frame->size());
        if (keyword >= 0) {
            std::cout << "[WakeWord] Detected keyword " << keyword << std::endl;
            return true;
        }
    }

    return false;
}

bool PorcupineWakeWordDetector::isReady() const {
    return impl_->ready;
}

int PorcupineWakeWordDetector::processFloat(const float* samples, size_t count) {
    if (!impl_->ready) return -1;

    auto& accumulator = impl_->accumulator;
    for (size_t i = 0; i < count; i++) {
        float sample = samples[i];
        if (sample > 1.0f) sample = 1.0f;
        if (sample < -1.0f) sample = -1.0f;
        accumulator.push_back(static_cast<int16_t>(sample * 32767.0f));
    }

    int result = -1;
    const size_t frame_length = static_cast<size_t>(impl_->frame_length);
    size_t offset = 0;
    while (accumulator.size() - offset >= frame_length) {
        int idx = impl_->process(accumulator.data() + offset);
        if (idx >= 0) {
            result = idx;
        }
        offset += frame_length;
    }
    accumulator.erase(accumulator.begin(), accumulator.begin() + static_cast<std::ptrdiff_t>(offset));

    return result;
}

} // namespace parley::wakeword
