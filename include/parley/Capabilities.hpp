/**
 * Capabilities.hpp - Interfaces the turn-taking engine consumes
 *
 * Every device, model and backend is reached through one of these shapes so
 * the engine can be wired to real hardware or to in-memory fakes.
 */

#pragma once

#include "parley/Types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace parley {

class WakeWordDetector {
public:
    virtual ~WakeWordDetector() = default;

    /**
     * Block until the wake signal fires.
     * @return true when woken, false when the process should shut down
     */
    virtual bool awaitWake() = 0;
};

class AudioRecorder {
public:
    virtual ~AudioRecorder() = default;

    /// Block until one utterance has been captured. Endpointing is up to the recorder.
    virtual CapturedUtterance record() = 0;
};

class SpeechToText {
public:
    virtual ~SpeechToText() = default;

    /**
     * Transcribe an utterance.
     * @throws TranscriptionError when the engine fails
     * @return transcript, possibly empty when nothing was said
     */
    virtual std::string transcribe(const CapturedUtterance& utterance,
                                   const std::optional<std::string>& language) = 0;
};

class ChatClient {
public:
    virtual ~ChatClient() = default;

    /// @throws ChatError
    virtual ChatReply chat(const std::string& message,
                           const std::string& session_id,
                           bool debug) = 0;
};

/// Receives one streamed chunk; return false to stop consuming the stream.
using ChunkCallback = std::function<bool(const std::string& chunk)>;

class StreamingChatClient : public ChatClient {
public:
    /**
     * Send a message and deliver reply chunks in arrival order.
     * Returns when the stream ends or on_chunk returns false.
     * @throws ChatError on request failure or mid-stream failure
     */
    virtual void chatStream(const std::string& message,
                            const std::string& session_id,
                            bool debug,
                            const ChunkCallback& on_chunk) = 0;
};

class TextToSpeech {
public:
    virtual ~TextToSpeech() = default;

    /// Blocking. Returns early when stop() is called from another thread.
    virtual void speak(const std::string& text) = 0;

    /// Halt any ongoing playback immediately. Thread-safe.
    virtual void stop() = 0;
};

/**
 * Pull-based source of microphone frames. The device side pushes into a
 * bounded queue; readers pop with a timeout. Only one reader at a time.
 */
class AudioFrameSource {
public:
    virtual ~AudioFrameSource() = default;

    /// Start delivering frames. false when the device is unavailable.
    virtual bool open() = 0;

    /// Next frame, or nullopt if none arrived within the timeout.
    virtual std::optional<AudioFrame> nextFrame(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

enum class Cue {
    Listening,
    Processing,
    Thinking,
    Speaking,
    Error
};

/// Optional audible feedback. Implementations must not throw.
class AudioFeedback {
public:
    virtual ~AudioFeedback() = default;
    virtual void play(Cue cue) = 0;
};

/**
 * Chat collaborator with its capability fixed at wiring time:
 * built from a StreamingChatClient it offers sentence streaming,
 * built from a plain ChatClient it offers whole replies only.
 */
class ChatBackend {
public:
    explicit ChatBackend(ChatClient& client) : basic_(&client) {}
    explicit ChatBackend(StreamingChatClient& client) : basic_(&client), streaming_(&client) {}

    ChatClient& basic() const { return *basic_; }
    StreamingChatClient* streaming() const { return streaming_; }
    bool supportsStreaming() const { return streaming_ != nullptr; }

private:
    ChatClient* basic_;
    StreamingChatClient* streaming_ = nullptr;
};

} // namespace parley
