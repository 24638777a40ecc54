/**
 * WhisperSpeechToText.hpp - Local speech recognition with whisper.cpp
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <memory>
#include <string>

namespace parley::stt {

/**
 * Model is loaded once in the constructor and stays resident. A missing model
 * leaves the engine not ready; transcribe() then throws TranscriptionError.
 */
class WhisperSpeechToText : public SpeechToText {
public:
    explicit WhisperSpeechToText(const std::string& model_path, int n_threads = 4);
    ~WhisperSpeechToText() override;

    WhisperSpeechToText(const WhisperSpeechToText&) = delete;
    WhisperSpeechToText& operator=(const WhisperSpeechToText&) = delete;

    std::string transcribe(const CapturedUtterance& utterance,
                           const std::optional<std::string>& language) override;

    bool isReady() const;
    std::string getModelInfo() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::stt
