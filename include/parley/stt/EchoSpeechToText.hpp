/**
 * EchoSpeechToText.hpp - Passes typed text through as the transcript
 */

#pragma once

#include "parley/Capabilities.hpp"

namespace parley::stt {

/// Returns the utterance's transcript hint; throws TranscriptionError without one.
class EchoSpeechToText : public SpeechToText {
public:
    std::string transcribe(const CapturedUtterance& utterance,
                           const std::optional<std::string>& language) override;
};

} // namespace parley::stt
