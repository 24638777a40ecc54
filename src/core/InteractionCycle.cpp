/**
 * InteractionCycle.cpp - Turn execution: record, transcribe, chat, speak
 *
 * Connects: AudioRecorder -> SpeechToText -> ChatBackend -> SentenceSegmenter -> TextToSpeech
 * with an InterruptionMonitor guarding every speaking window.
 */

#include "parley/core/InteractionCycle.hpp"
#include "parley/Errors.hpp"
#include "parley/core/CancellationSignal.hpp"
#include "parley/core/InterruptionMonitor.hpp"
#include "parley/core/SentenceSegmenter.hpp"

#include <iostream>
#include <utility>

namespace parley::core {

namespace {

std::string preview(const std::string& text, size_t limit = 100) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "...";
}

} // anonymous namespace

struct InteractionCycle::Impl {
    CycleCollaborators io;
    CycleOptions options;
    CycleCallbacks callbacks;

    Impl(CycleCollaborators c, CycleOptions o)
        : io(std::move(c)), options(std::move(o)) {}

    void cue(Cue which) {
        if (io.feedback) {
            io.feedback->play(which);
        }
    }

    // Empty optional when interruption is disabled
    void startMonitor(std::optional<InterruptionMonitor>& monitor, CancellationSignal& signal) {
        if (!options.allow_interruption) return;

        MonitorOptions monitor_options;
        monitor_options.threshold = options.interrupt_threshold;
        monitor_options.poll_interval = options.poll_interval;

        TextToSpeech& tts = io.tts;
        monitor.emplace(io.input, signal, [&tts]() { tts.stop(); }, monitor_options);
    }

    void speak(const std::string& text) {
        std::cout << "[InteractionCycle] Speaking: " << text << std::endl;
        if (callbacks.onAssistantSentence) {
            callbacks.onAssistantSentence(text);
        }
        io.tts.speak(text);
    }

    TurnResult run(Session& session) {
        CancellationSignal signal;

        cue(Cue::Listening);
        std::cout << "\n[InteractionCycle] Recording audio..." << std::endl;
        const CapturedUtterance utterance = io.recorder.record();

        cue(Cue::Processing);
        std::cout << "[InteractionCycle] Transcribing " << utterance.durationSeconds() << "s of audio..." << std::endl;

        std::string transcript;
        try {
            transcript = SentenceSegmenter::trim(io.stt.transcribe(utterance, options.language));
        } catch (const TranscriptionError& e) {
            std::cerr << "[InteractionCycle] Transcription failed: " << e.what() << std::endl;
            cue(Cue::Error);
            return TurnResult::aborted(e.what());
        }

        if (transcript.empty()) {
            std::cout << "[InteractionCycle] No speech captured. Try again." << std::endl;
            cue(Cue::Error);
            return TurnResult::completed(false);
        }

        std::cout << "[InteractionCycle] User: " << transcript << std::endl;
        if (callbacks.onUserUtterance) {
            callbacks.onUserUtterance(transcript);
        }

        cue(Cue::Thinking);
        try {
            if (io.chat.supportsStreaming()) {
                converseStreaming(transcript, session, signal);
            } else {
                converseWhole(transcript, session, signal);
            }
        } catch (const ChatError& e) {
            std::cerr << "[InteractionCycle] Chat error: " << e.what() << std::endl;
            cue(Cue::Error);
            return TurnResult::aborted(e.what());
        } catch (const SpeechError& e) {
            std::cerr << "[InteractionCycle] Speech output failed: " << e.what() << std::endl;
            cue(Cue::Error);
            return TurnResult::aborted(e.what());
        }

        std::cout << "[InteractionCycle] Done" << (signal.isSet() ? " (interrupted)" : "") << std::endl;
        return TurnResult::completed(signal.isSet());
    }

    void converseStreaming(const std::string& transcript, Session& session, CancellationSignal& signal) {
        std::cout << "[InteractionCycle] Streaming response..." << std::endl;

        SentenceSegmenter segmenter;
        cue(Cue::Speaking);

        std::optional<InterruptionMonitor> monitor;
        startMonitor(monitor, signal);

        io.chat.streaming()->chatStream(
            transcript, session.id(), options.debug,
            [&](const std::string& chunk) {
                if (signal.isSet()) return false;

                for (const auto& sentence : segmenter.add(chunk)) {
                    if (signal.isSet()) return false;
                    speak(sentence);
                }
                return !signal.isSet();
            });

        if (signal.isSet()) {
            return;
        }

        std::string remaining = segmenter.flush();
        if (!remaining.empty()) {
            speak(remaining);
        }
    }

    void converseWhole(const std::string& transcript, Session& session, CancellationSignal& signal) {
        std::cout << "[InteractionCycle] Sending to chat service..." << std::endl;

        ChatReply reply = io.chat.basic().chat(transcript, session.id(), options.debug);
        if (reply.session_id) {
            session.adopt(*reply.session_id);
        }

        std::cout << "[InteractionCycle] Got response: " << preview(reply.text) << std::endl;

        std::string text = SentenceSegmenter::trim(reply.text);
        if (text.empty()) {
            std::cout << "[InteractionCycle] Empty reply, nothing to say" << std::endl;
            return;
        }

        cue(Cue::Speaking);

        std::optional<InterruptionMonitor> monitor;
        startMonitor(monitor, signal);
        speak(text);
    }
};

InteractionCycle::InteractionCycle(CycleCollaborators collaborators, CycleOptions options)
    : impl_(std::make_unique<Impl>(std::move(collaborators), std::move(options))) {
    if (impl_->io.chat.supportsStreaming()) {
        std::cout << "[InteractionCycle] Chat backend streams - speaking sentence by sentence" << std::endl;
    }
}

InteractionCycle::~InteractionCycle() = default;

TurnResult InteractionCycle::run(Session& session) {
    return impl_->run(session);
}

bool InteractionCycle::supportsStreaming() const {
    return impl_->io.chat.supportsStreaming();
}

void InteractionCycle::setCallbacks(CycleCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

} // namespace parley::core
