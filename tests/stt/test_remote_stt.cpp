/**
 * test_remote_stt.cpp - HTTP transcription client against a loopback server
 */

#include "parley/Errors.hpp"
#include "parley/audio/PcmUtils.hpp"
#include "parley/stt/RemoteSpeechToText.hpp"
#include "support/LoopbackServer.hpp"

#include <httplib.h>

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace parley;
using parley::testing::LoopbackServer;

namespace {

CapturedUtterance tone(size_t samples, int sample_rate = 16000) {
    CapturedUtterance utterance;
    utterance.sample_rate = sample_rate;
    utterance.samples.assign(samples, 0.25f);
    return utterance;
}

bool throwsTranscriptionError(stt::RemoteSpeechToText& client, const std::string& expect_in_message) {
    try {
        client.transcribe(tone(160), std::nullopt);
    } catch (const TranscriptionError& e) {
        return std::string(e.what()).find(expect_in_message) != std::string::npos;
    }
    return false;
}

} // anonymous namespace

void test_json_reply() {
    LoopbackServer srv;
    std::string content_type;
    std::vector<uint8_t> received;
    srv.server.Post("/whisper/transcribe", [&](const httplib::Request& req, httplib::Response& res) {
        content_type = req.get_header_value("Content-Type");
        received.assign(req.body.begin(), req.body.end());
        res.set_content(R"({"text": "  turn on the lights \n"})", "application/json");
    });
    srv.start();

    stt::RemoteSttOptions options;
    options.base_url = srv.url("/whisper");
    stt::RemoteSpeechToText client(options);

    std::string text = client.transcribe(tone(800, 22050), std::string("en"));
    assert(text == "turn on the lights");
    assert(content_type == "audio/wav");

    // Body is the utterance as 16-bit WAV at its own rate
    auto clip = audio::decodeWav(received);
    assert(clip);
    assert(clip->sample_rate == 22050);
    assert(clip->samples.size() == 800);

    std::cout << "[PASS] test_json_reply" << std::endl;
}

void test_plain_text_reply() {
    LoopbackServer srv;
    srv.server.Post("/transcribe", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("what time is it\n", "text/plain");
    });
    srv.start();

    stt::RemoteSttOptions options;
    options.base_url = srv.url();
    stt::RemoteSpeechToText client(options);
    assert(client.transcribe(tone(160), std::nullopt) == "what time is it");

    std::cout << "[PASS] test_plain_text_reply" << std::endl;
}

void test_empty_audio_skips_request() {
    LoopbackServer srv;
    std::atomic<int> requests{0};
    srv.server.Post("/transcribe", [&](const httplib::Request&, httplib::Response& res) {
        requests++;
        res.set_content(R"({"text": "unexpected"})", "application/json");
    });
    srv.start();

    stt::RemoteSttOptions options;
    options.base_url = srv.url();
    stt::RemoteSpeechToText client(options);
    assert(client.transcribe(CapturedUtterance{}, std::nullopt).empty());
    assert(requests == 0);

    std::cout << "[PASS] test_empty_audio_skips_request" << std::endl;
}

void test_failures() {
    LoopbackServer srv;
    srv.server.Post("/down/transcribe", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
        res.set_content("model loading", "text/plain");
    });
    srv.server.Post("/garbage/transcribe", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{not json", "application/json");
    });
    srv.server.Post("/shape/transcribe", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"text": 42})", "application/json");
    });
    srv.server.Post("/silent/transcribe", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"segments": []})", "application/json");
    });
    srv.start();

    stt::RemoteSttOptions options;

    options.base_url = srv.url("/down");
    stt::RemoteSpeechToText down(options);
    assert(throwsTranscriptionError(down, "503"));

    options.base_url = srv.url("/garbage");
    stt::RemoteSpeechToText garbage(options);
    assert(throwsTranscriptionError(garbage, "invalid JSON"));

    options.base_url = srv.url("/shape");
    stt::RemoteSpeechToText shape(options);
    assert(throwsTranscriptionError(shape, "not a string"));

    // No text member means nothing was heard
    options.base_url = srv.url("/silent");
    stt::RemoteSpeechToText silent(options);
    assert(silent.transcribe(tone(160), std::nullopt).empty());

    std::cout << "[PASS] test_failures" << std::endl;
}

void test_unreachable() {
    stt::RemoteSttOptions options;
    options.base_url = "http://127.0.0.1:1";
    options.timeout_seconds = 2;
    stt::RemoteSpeechToText client(options);
    assert(throwsTranscriptionError(client, "unreachable"));

    std::cout << "[PASS] test_unreachable" << std::endl;
}

int main() {
    std::cout << "=== Remote STT Tests ===" << std::endl;

    test_json_reply();
    test_plain_text_reply();
    test_empty_audio_skips_request();
    test_failures();
    test_unreachable();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
