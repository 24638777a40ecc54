/**
 * RemoteTextToSpeech.hpp - Speech synthesis through an HTTP /synthesize service
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/audio/AudioEngine.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace parley::tts {

struct RemoteTtsOptions {
    std::string base_url = "http://localhost:5000";
    std::string speaker;              // optional voice name
    int timeout_seconds = 30;
    int raw_sample_rate = 16000;      // for headerless int16 responses
};

/**
 * POST <url>/synthesize with {"text", "speaker"?}; the WAV reply is decoded
 * and played through the AudioEngine. stop() halts playback and discards a
 * clip still being fetched.
 */
class RemoteTextToSpeech : public TextToSpeech {
public:
    RemoteTextToSpeech(audio::AudioEngine& engine, RemoteTtsOptions options);
    ~RemoteTextToSpeech() override;

    /// @throws SpeechError on HTTP, decode or playback failure
    void speak(const std::string& text) override;
    void stop() override;

    /// GET <url>/health answers 200.
    bool isHealthy();

private:
    std::vector<uint8_t> fetch(const std::string& text);

    audio::AudioEngine& engine_;
    RemoteTtsOptions options_;

    struct Http;
    std::unique_ptr<Http> http_;
};

} // namespace parley::tts
