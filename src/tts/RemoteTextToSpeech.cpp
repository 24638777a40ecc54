/**
 * RemoteTextToSpeech.cpp - HTTP synthesis server client
 *
 * The server keeps the voice model resident; each call returns one WAV clip.
 */

#include "parley/tts/RemoteTextToSpeech.hpp"
#include "parley/Errors.hpp"
#include "parley/audio/PcmUtils.hpp"
#include "parley/chat/ChatProtocol.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley::tts {

struct RemoteTextToSpeech::Http {
    std::string path_prefix;
    std::unique_ptr<httplib::Client> client;
};

RemoteTextToSpeech::RemoteTextToSpeech(audio::AudioEngine& engine, RemoteTtsOptions options)
    : engine_(engine)
    , options_(std::move(options))
    , http_(std::make_unique<Http>())
{
    chat::EndpointBase base = chat::splitBaseUrl(options_.base_url);
    http_->path_prefix = base.path_prefix;
    http_->client = std::make_unique<httplib::Client>(base.origin);
    http_->client->set_connection_timeout(options_.timeout_seconds, 0);
    http_->client->set_read_timeout(options_.timeout_seconds, 0);

    std::cout << "[TTS] Synthesis server: " << options_.base_url;
    if (!options_.speaker.empty()) {
        std::cout << " (speaker " << options_.speaker << ")";
    }
    std::cout << std::endl;
}

RemoteTextToSpeech::~RemoteTextToSpeech() = default;

bool RemoteTextToSpeech::isHealthy() {
    auto res = http_->client->Get(http_->path_prefix + "/health");
    return res && res->status == 200;
}

std::vector<uint8_t> RemoteTextToSpeech::fetch(const std::string& text) {
    json req_json = {{"text", text}};
    if (!options_.speaker.empty()) {
        req_json["speaker"] = options_.speaker;
    }

    auto res = http_->client->Post(http_->path_prefix + "/synthesize", req_json.dump(), "application/json");

    if (!res) {
        throw SpeechError("Synthesis server unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw SpeechError("Synthesis failed (" + std::to_string(res->status) + "): " + res->body);
    }
    if (res->body.empty()) {
        throw SpeechError("Synthesis server returned no audio");
    }

    return std::vector<uint8_t>(res->body.begin(), res->body.end());
}

void RemoteTextToSpeech::speak(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    const uint64_t epoch = engine_.playbackEpoch();

    std::vector<uint8_t> bytes = fetch(text);

    audio::PcmClip clip;
    if (bytes.size() >= 4 && bytes[0] == 'R' && bytes[1] == 'I' && bytes[2] == 'F' && bytes[3] == 'F') {
        std::string error;
        auto decoded = audio::decodeWav(bytes, &error);
        if (!decoded) {
            throw SpeechError("Invalid WAV from synthesis server: " + error);
        }
        clip = std::move(*decoded);
    } else {
        // Headerless little-endian int16
        clip.sample_rate = options_.raw_sample_rate;
        clip.samples.reserve(bytes.size() / 2);
        for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
            auto raw = static_cast<int16_t>(bytes[i] | (bytes[i + 1] << 8));
            clip.samples.push_back(static_cast<float>(raw) / 32768.0f);
        }
    }

    if (engine_.playbackEpoch() != epoch) {
        std::cout << "[TTS] Stopped before playback" << std::endl;
        return;
    }

    if (!engine_.play(clip.samples.data(), clip.samples.size(), clip.sample_rate, epoch)) {
        if (engine_.playbackEpoch() != epoch) {
            std::cout << "[TTS] Playback stopped" << std::endl;
            return;
        }
        throw SpeechError("Playback failed: " + engine_.lastError());
    }
}

void RemoteTextToSpeech::stop() {
    engine_.stopPlayback();
}

} // namespace parley::tts
