/**
 * RemoteSpeechToText.hpp - Speech recognition through an HTTP /transcribe service
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <memory>
#include <string>

namespace parley::stt {

struct RemoteSttOptions {
    std::string base_url = "http://localhost:9000";
    int timeout_seconds = 30;
};

/**
 * POST <url>/transcribe with the utterance as a 16-bit PCM WAV body.
 * A JSON reply is read as {"text": "..."}; any other reply body is taken
 * as the transcript itself.
 */
class RemoteSpeechToText : public SpeechToText {
public:
    explicit RemoteSpeechToText(RemoteSttOptions options);
    ~RemoteSpeechToText() override;

    /// @throws TranscriptionError on HTTP failure or a malformed JSON reply
    std::string transcribe(const CapturedUtterance& utterance,
                           const std::optional<std::string>& language) override;

private:
    RemoteSttOptions options_;

    struct Http;
    std::unique_ptr<Http> http_;
};

} // namespace parley::stt
