/**
 * EchoSpeechToText.cpp - Console transcript passthrough
 */

#include "parley/stt/EchoSpeechToText.hpp"
#include "parley/Errors.hpp"

namespace parley::stt {

std::string EchoSpeechToText::transcribe(const CapturedUtterance& utterance,
                                         const std::optional<std::string>& /*language*/) {
    if (!utterance.transcript_hint) {
        throw TranscriptionError("no typed transcript attached to utterance");
    }
    return *utterance.transcript_hint;
}

} // namespace parley::stt
