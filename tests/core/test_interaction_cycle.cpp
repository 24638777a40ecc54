/**
 * test_interaction_cycle.cpp - One turn: record, transcribe, chat, speak
 */

#include "parley/core/FollowUpListener.hpp"
#include "parley/core/InteractionCycle.hpp"
#include "parley/core/InterruptionMonitor.hpp"
#include "support/Fakes.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace parley;
using namespace parley::core;
using namespace parley::testing;

using Lines = std::vector<std::string>;

namespace {

// Injects a loud frame while the given sentence is playing and blocks until stopped
void bargeInDuring(RecordingTts& tts, FakeFrameSource& source, const std::string& sentence) {
    tts.on_speak = [&tts, &source, sentence](const std::string& text) {
        if (text == sentence) {
            source.inject(loudFrame());
            bool stopped = tts.waitForStop(std::chrono::seconds(2));
            assert(stopped);
        }
    };
}

class ExplodingStt : public SpeechToText {
public:
    std::string transcribe(const CapturedUtterance&, const std::optional<std::string>&) override {
        throw std::logic_error("model state corrupted");
    }
};

} // anonymous namespace

void test_whole_reply_spoken() {
    FakeRecorder recorder({"what time is it"});
    FakeStt stt;
    FakeChat chat({{"It is noon."}});
    RecordingTts tts;
    FakeFrameSource source;
    RecordingFeedback feedback;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source, &feedback});
    assert(!cycle.supportsStreaming());

    Session session("session-fixed");
    TurnResult result = cycle.run(session);

    assert(!result.isAborted());
    assert(!result.interrupted);
    assert(tts.spoken() == Lines({"It is noon."}));
    assert(chat.messages == Lines({"what time is it"}));
    assert(chat.session_ids == Lines({"session-fixed"}));

    std::vector<Cue> expected = {Cue::Listening, Cue::Processing, Cue::Thinking, Cue::Speaking};
    assert(feedback.cues() == expected);

    assert(source.open_count == 1);
    assert(source.close_count == 1);

    std::cout << "[PASS] test_whole_reply_spoken" << std::endl;
}

void test_backend_session_adopted() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    FakeChat chat({{"Hi!", std::string("backend-42")}});
    RecordingTts tts;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts});

    Session session("session-local");
    cycle.run(session);
    assert(session.id() == "backend-42");

    std::cout << "[PASS] test_backend_session_adopted" << std::endl;
}

void test_streaming_speaks_by_sentence() {
    FakeRecorder recorder({"how are you"});
    FakeStt stt;
    FakeStreamingChat chat({{"Hi", " there.", " How are you?"}});
    RecordingTts tts;
    FakeFrameSource source;

    Lines heard_before_end;
    tts.on_speak = [&](const std::string& text) {
        heard_before_end.push_back(text + "@" + std::to_string(chat.delivered));
    };

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source});
    assert(cycle.supportsStreaming());

    Session session;
    TurnResult result = cycle.run(session);

    assert(!result.isAborted());
    assert(!result.interrupted);
    assert(tts.spoken() == Lines({"Hi there.", "How are you?"}));
    // First sentence goes out as soon as the third chunk completes it
    assert(heard_before_end.front() == "Hi there.@3");
    assert(source.open_count == 1);
    assert(source.close_count == 1);

    std::cout << "[PASS] test_streaming_speaks_by_sentence" << std::endl;
}

void test_streaming_barge_in_stops_stream() {
    FakeRecorder recorder({"tell me a story"});
    FakeStt stt;
    FakeStreamingChat chat({{"First sentence. ", "Second sentence. ", "Third one."}});
    RecordingTts tts;
    FakeFrameSource source;
    bargeInDuring(tts, source, "First sentence.");

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source});

    Session session;
    TurnResult result = cycle.run(session);

    assert(!result.isAborted());
    assert(result.interrupted);
    assert(tts.spoken() == Lines({"First sentence."}));
    assert(tts.stopCount() == 1);
    assert(chat.stopped_by_consumer);
    assert(chat.delivered == 1);
    assert(source.active_readers == 0);

    std::cout << "[PASS] test_streaming_barge_in_stops_stream" << std::endl;
}

void test_whole_reply_barge_in() {
    FakeRecorder recorder({"read the news"});
    FakeStt stt;
    FakeChat chat({{"Here is a very long bulletin."}});
    RecordingTts tts;
    FakeFrameSource source;
    bargeInDuring(tts, source, "Here is a very long bulletin.");

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source});

    Session session;
    TurnResult result = cycle.run(session);

    assert(result.interrupted);
    assert(tts.stopCount() == 1);
    assert(source.close_count == 1);

    std::cout << "[PASS] test_whole_reply_barge_in" << std::endl;
}

void test_empty_transcript_skips_chat() {
    FakeRecorder recorder({"   "});
    FakeStt stt;
    FakeChat chat;
    RecordingTts tts;
    RecordingFeedback feedback;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, nullptr, &feedback});

    Session session;
    TurnResult result = cycle.run(session);

    assert(!result.isAborted());
    assert(!result.interrupted);
    assert(chat.messages.empty());
    assert(tts.spoken().empty());
    assert(feedback.played(Cue::Error));
    assert(!feedback.played(Cue::Thinking));

    std::cout << "[PASS] test_empty_transcript_skips_chat" << std::endl;
}

void test_transcription_error_aborts() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    stt.fail = true;
    FakeChat chat;
    RecordingTts tts;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts});

    Session session;
    TurnResult result = cycle.run(session);

    assert(result.isAborted());
    assert(result.error.find("decoder crashed") != std::string::npos);
    assert(chat.messages.empty());

    std::cout << "[PASS] test_transcription_error_aborts" << std::endl;
}

void test_chat_error_aborts() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    FakeChat chat({{"", std::nullopt, true}});
    RecordingTts tts;
    FakeFrameSource source;
    RecordingFeedback feedback;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source, &feedback});

    Session session;
    TurnResult result = cycle.run(session);

    assert(result.isAborted());
    assert(tts.spoken().empty());
    assert(feedback.cues().back() == Cue::Error);
    assert(source.open_count == 0);

    std::cout << "[PASS] test_chat_error_aborts" << std::endl;
}

void test_stream_error_mid_reply_aborts() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    FakeStreamingChat chat(std::vector<std::vector<std::string>>{{"One. ", "Two."}});
    chat.fail_at_chunk = 1;
    RecordingTts tts;
    FakeFrameSource source;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source});

    Session session;
    TurnResult result = cycle.run(session);

    assert(result.isAborted());
    assert(tts.spoken() == Lines({"One."}));
    assert(source.open_count == 1);
    assert(source.close_count == 1);

    std::cout << "[PASS] test_stream_error_mid_reply_aborts" << std::endl;
}

void test_speech_error_aborts() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    FakeChat chat({{"Broken speaker."}});
    RecordingTts tts;
    tts.fail_on = "Broken speaker.";
    FakeFrameSource source;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source});

    Session session;
    TurnResult result = cycle.run(session);

    assert(result.isAborted());
    assert(source.close_count == 1);

    std::cout << "[PASS] test_speech_error_aborts" << std::endl;
}

void test_interruption_disabled() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    FakeChat chat({{"Uninterruptible."}});
    RecordingTts tts;
    FakeFrameSource source;
    source.pushOnOpen(1, loudFrame());

    CycleOptions options;
    options.allow_interruption = false;
    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts, &source}, options);

    Session session;
    TurnResult result = cycle.run(session);

    assert(!result.interrupted);
    assert(source.open_count == 0);
    assert(tts.stopCount() == 0);

    std::cout << "[PASS] test_interruption_disabled" << std::endl;
}

void test_empty_reply_not_spoken() {
    FakeRecorder recorder({"hello"});
    FakeStt stt;
    FakeChat chat({{"   "}});
    RecordingTts tts;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts});

    Session session;
    TurnResult result = cycle.run(session);

    assert(!result.isAborted());
    assert(tts.spoken().empty());

    std::cout << "[PASS] test_empty_reply_not_spoken" << std::endl;
}

void test_language_hint_and_callbacks() {
    FakeRecorder recorder({"  bonjour  "});
    FakeStt stt;
    FakeStreamingChat chat(std::vector<std::vector<std::string>>{{"Salut! ", "Ça va?"}});
    RecordingTts tts;

    CycleOptions options;
    options.language = "fr";
    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts}, options);

    Lines user;
    Lines assistant;
    cycle.setCallbacks({
        [&](const std::string& text) { user.push_back(text); },
        [&](const std::string& text) { assistant.push_back(text); }
    });

    Session session;
    cycle.run(session);

    assert(stt.last_language && *stt.last_language == "fr");
    assert(user == Lines({"bonjour"}));
    assert(chat.messages == Lines({"bonjour"}));
    assert(assistant == Lines({"Salut!", "Ça va?"}));

    std::cout << "[PASS] test_language_hint_and_callbacks" << std::endl;
}

void test_unexpected_error_propagates() {
    FakeRecorder recorder({"hello"});
    ExplodingStt stt;
    FakeChat chat;
    RecordingTts tts;

    InteractionCycle cycle({recorder, stt, ChatBackend(chat), tts});

    Session session;
    bool thrown = false;
    try {
        cycle.run(session);
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[PASS] test_unexpected_error_propagates" << std::endl;
}

void test_default_options_share_speech_gate() {
    CycleOptions cycle;
    MonitorOptions monitor;
    ListenerOptions listener;

    assert(cycle.interrupt_threshold == kSpeechEnergyThreshold);
    assert(monitor.threshold == kSpeechEnergyThreshold);
    assert(listener.threshold == kSpeechEnergyThreshold);
    assert(cycle.allow_interruption);

    std::cout << "[PASS] test_default_options_share_speech_gate" << std::endl;
}

int main() {
    std::cout << "=== InteractionCycle Tests ===" << std::endl;

    test_default_options_share_speech_gate();
    test_whole_reply_spoken();
    test_backend_session_adopted();
    test_streaming_speaks_by_sentence();
    test_streaming_barge_in_stops_stream();
    test_whole_reply_barge_in();
    test_empty_transcript_skips_chat();
    test_transcription_error_aborts();
    test_chat_error_aborts();
    test_stream_error_mid_reply_aborts();
    test_speech_error_aborts();
    test_interruption_disabled();
    test_empty_reply_not_spoken();
    test_language_hint_and_callbacks();
    test_unexpected_error_propagates();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
