/**
 * InteractionCycle.hpp - One listen -> transcribe -> converse -> speak turn
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/Session.hpp"
#include "parley/Types.hpp"
#include "parley/core/FrameStream.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace parley::core {

struct CycleOptions {
    std::optional<std::string> language;   // STT hint
    bool debug = false;                     // forwarded to the chat backend
    bool allow_interruption = true;
    float interrupt_threshold = kSpeechEnergyThreshold;
    std::chrono::milliseconds poll_interval{50};
};

/**
 * Collaborators used by a cycle. All references must outlive the cycle.
 * input and feedback are optional.
 */
struct CycleCollaborators {
    AudioRecorder& recorder;
    SpeechToText& stt;
    ChatBackend chat;
    TextToSpeech& tts;
    AudioFrameSource* input = nullptr;
    AudioFeedback* feedback = nullptr;
};

struct CycleCallbacks {
    std::function<void(const std::string&)> onUserUtterance;
    std::function<void(const std::string&)> onAssistantSentence;
};

/**
 * Runs one conversational turn.
 *
 * With a streaming backend, chunks are segmented into sentences that are
 * spoken as soon as they complete, and a barge-in monitor covers the whole
 * streaming and speaking phase. Otherwise the full reply is awaited and
 * spoken in one call with the monitor covering only that call.
 *
 * ChatError, TranscriptionError and SpeechError become an aborted TurnResult.
 * Any other exception propagates to the caller.
 */
class InteractionCycle {
public:
    InteractionCycle(CycleCollaborators collaborators, CycleOptions options = {});
    ~InteractionCycle();

    InteractionCycle(const InteractionCycle&) = delete;
    InteractionCycle& operator=(const InteractionCycle&) = delete;

    TurnResult run(Session& session);

    bool supportsStreaming() const;

    void setCallbacks(CycleCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::core
