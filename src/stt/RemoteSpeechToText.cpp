/**
 * RemoteSpeechToText.cpp - HTTP transcription server client
 */

#include "parley/stt/RemoteSpeechToText.hpp"
#include "parley/Errors.hpp"
#include "parley/audio/PcmUtils.hpp"
#include "parley/chat/ChatProtocol.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley::stt {

namespace {

std::string strip(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

struct RemoteSpeechToText::Http {
    std::string path_prefix;
    std::unique_ptr<httplib::Client> client;
};

RemoteSpeechToText::RemoteSpeechToText(RemoteSttOptions options)
    : options_(std::move(options))
    , http_(std::make_unique<Http>())
{
    chat::EndpointBase base = chat::splitBaseUrl(options_.base_url);
    http_->path_prefix = base.path_prefix;
    http_->client = std::make_unique<httplib::Client>(base.origin);
    http_->client->set_connection_timeout(options_.timeout_seconds, 0);
    http_->client->set_read_timeout(options_.timeout_seconds, 0);

    std::cout << "[STT] Transcription server: " << options_.base_url << std::endl;
}

RemoteSpeechToText::~RemoteSpeechToText() = default;

// The server detects the language itself
std::string RemoteSpeechToText::transcribe(const CapturedUtterance& utterance,
                                           const std::optional<std::string>& /*language*/) {
    if (utterance.samples.empty()) {
        return "";
    }

    std::vector<uint8_t> wav = audio::encodeWav16(utterance.samples, utterance.sample_rate);
    std::string body(wav.begin(), wav.end());

    auto res = http_->client->Post(http_->path_prefix + "/transcribe", body, "audio/wav");

    if (!res) {
        throw TranscriptionError("Transcription server unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw TranscriptionError("Transcription failed (" + std::to_string(res->status) + "): " + res->body);
    }

    if (res->get_header_value("Content-Type").find("application/json") == std::string::npos) {
        return strip(res->body);
    }

    json reply = json::parse(res->body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw TranscriptionError("Transcription server returned invalid JSON");
    }

    auto text = reply.find("text");
    if (text == reply.end() || text->is_null()) {
        return "";
    }
    if (!text->is_string()) {
        throw TranscriptionError("Transcription reply 'text' is not a string");
    }
    return strip(text->get<std::string>());
}

} // namespace parley::stt
