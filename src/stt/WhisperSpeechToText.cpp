/**
 * WhisperSpeechToText.cpp - Speech-to-Text using whisper.cpp
 *
 * Uses whisper.cpp for local, offline speech recognition.
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "parley/stt/WhisperSpeechToText.hpp"
#include "parley/Errors.hpp"
#include "parley/audio/PcmUtils.hpp"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "whisper.h"

namespace parley::stt {

struct WhisperSpeechToText::Impl {
    std::string model_path;
    int n_threads;

    whisper_context* ctx = nullptr;
    std::mutex mutex;   // whisper_full is not reentrant on one context

    Impl(const std::string& path, int threads)
        : model_path(path), n_threads(threads) {

        struct whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[STT] Failed to load model: " << model_path << std::endl;
            return;
        }

        std::cout << "[STT] Model loaded: " << model_path << " (threads: " << n_threads << ")" << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }

    whisper_full_params makeParams(const std::string& language) const {
        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = language.c_str();
        params.detect_language = false;
        params.n_threads = n_threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.single_segment = false;
        params.no_context = true;
        return params;
    }
};

WhisperSpeechToText::WhisperSpeechToText(const std::string& model_path, int n_threads)
    : impl_(std::make_unique<Impl>(model_path, n_threads)) {
}

WhisperSpeechToText::~WhisperSpeechToText() = default;

std::string WhisperSpeechToText::transcribe(const CapturedUtterance& utterance,
                                            const std::optional<std::string>& language) {
    if (!impl_->ctx) {
        throw TranscriptionError("whisper model not loaded: " + impl_->model_path);
    }

    if (utterance.samples.empty()) {
        return "";
    }

    // whisper expects 16 kHz mono
    std::vector<float> audio = audio::resampleLinear(
        utterance.samples, utterance.sample_rate, WHISPER_SAMPLE_RATE);

    const std::string lang = (language && !language->empty()) ? *language : "auto";

    std::lock_guard<std::mutex> lock(impl_->mutex);
    whisper_full_params params = impl_->makeParams(lang);

    int result = whisper_full(impl_->ctx, params, audio.data(), static_cast<int>(audio.size()));
    if (result != 0) {
        std::cerr << "[STT] Transcription failed: " << result << std::endl;
        throw TranscriptionError("whisper_full failed with code " + std::to_string(result));
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(impl_->ctx);

    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    return text;
}

bool WhisperSpeechToText::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string WhisperSpeechToText::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->model_path + ")";
}

} // namespace parley::stt
