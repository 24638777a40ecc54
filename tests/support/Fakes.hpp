/**
 * Fakes.hpp - In-memory capabilities for driving the engine without hardware
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/Errors.hpp"
#include "parley/audio/FrameQueue.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace parley::testing {

inline AudioFrame loudFrame(float level = 0.5f) {
    return AudioFrame(kDefaultFrameSamples, level);
}

inline AudioFrame quietFrame() {
    return AudioFrame(kDefaultFrameSamples, 0.001f);
}

/**
 * Scripted microphone. Frames registered with pushOnOpen(n, ...) are queued
 * when the n-th open() happens (1-based); inject() queues a frame right away.
 * Tracks how many readers hold the stream at once.
 */
class FakeFrameSource : public AudioFrameSource {
public:
    bool fail_open = false;
    bool throw_on_open = false;
    bool throw_on_read = false;

    std::atomic<int> open_count{0};
    std::atomic<int> close_count{0};
    std::atomic<int> active_readers{0};
    std::atomic<int> max_concurrent_readers{0};

    bool open() override {
        if (throw_on_open) throw std::runtime_error("device busy");
        if (fail_open) return false;

        const int n = ++open_count;
        const int readers = ++active_readers;
        int seen = max_concurrent_readers.load();
        while (readers > seen && !max_concurrent_readers.compare_exchange_weak(seen, readers)) {
        }

        queue_.clear();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = on_open_.find(n);
        if (it != on_open_.end()) {
            for (auto& frame : it->second) {
                queue_.push(frame);
            }
        }
        return true;
    }

    std::optional<AudioFrame> nextFrame(std::chrono::milliseconds timeout) override {
        if (throw_on_read) throw std::runtime_error("device unplugged");
        return queue_.pop(timeout);
    }

    void close() override {
        ++close_count;
        --active_readers;
    }

    void pushOnOpen(int open_index, AudioFrame frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_open_[open_index].push_back(std::move(frame));
    }

    void inject(AudioFrame frame) {
        queue_.push(std::move(frame));
    }

private:
    audio::FrameQueue queue_{256};
    std::mutex mutex_;
    std::map<int, std::vector<AudioFrame>> on_open_;
};

/// Returns the scripted answers in order, then false.
class ScriptedWake : public WakeWordDetector {
public:
    explicit ScriptedWake(std::vector<bool> script) : script_(std::move(script)) {}

    bool awaitWake() override {
        calls++;
        if (index_ >= script_.size()) return false;
        return script_[index_++];
    }

    int calls = 0;

private:
    std::vector<bool> script_;
    size_t index_ = 0;
};

/// Each record() returns the next scripted transcript as a typed hint; "" once exhausted.
class FakeRecorder : public AudioRecorder {
public:
    explicit FakeRecorder(std::vector<std::string> transcripts = {})
        : transcripts_(std::move(transcripts)) {}

    CapturedUtterance record() override {
        CapturedUtterance utterance;
        utterance.samples.assign(1600, 0.0f);
        utterance.transcript_hint = index_ < transcripts_.size() ? transcripts_[index_] : std::string();
        index_++;
        calls++;
        return utterance;
    }

    int calls = 0;

private:
    std::vector<std::string> transcripts_;
    size_t index_ = 0;
};

class FakeStt : public SpeechToText {
public:
    bool fail = false;
    std::optional<std::string> last_language;

    std::string transcribe(const CapturedUtterance& utterance,
                           const std::optional<std::string>& language) override {
        last_language = language;
        if (fail) throw TranscriptionError("decoder crashed");
        return utterance.transcript_hint.value_or("");
    }
};

struct ScriptedReply {
    std::string text;
    std::optional<std::string> session_id;
    bool fail = false;
};

class FakeChat : public ChatClient {
public:
    explicit FakeChat(std::vector<ScriptedReply> replies = {}) : replies_(std::move(replies)) {}

    ChatReply chat(const std::string& message, const std::string& session_id, bool /*debug*/) override {
        messages.push_back(message);
        session_ids.push_back(session_id);

        ScriptedReply scripted = index_ < replies_.size() ? replies_[index_] : ScriptedReply{"Okay."};
        index_++;
        if (scripted.fail) throw ChatError("backend unavailable");
        return ChatReply{scripted.text, scripted.session_id};
    }

    std::vector<std::string> messages;
    std::vector<std::string> session_ids;

private:
    std::vector<ScriptedReply> replies_;
    size_t index_ = 0;
};

/**
 * Each chatStream() call delivers the next chunk script. fail_at_chunk >= 0
 * throws ChatError before delivering that chunk.
 */
class FakeStreamingChat : public StreamingChatClient {
public:
    explicit FakeStreamingChat(std::vector<std::vector<std::string>> scripts = {})
        : scripts_(std::move(scripts)) {}

    int fail_at_chunk = -1;

    ChatReply chat(const std::string& message, const std::string& session_id, bool debug) override {
        std::string text;
        chatStream(message, session_id, debug, [&](const std::string& chunk) {
            text += chunk;
            return true;
        });
        return ChatReply{text, std::nullopt};
    }

    void chatStream(const std::string& message, const std::string& session_id, bool /*debug*/,
                    const ChunkCallback& on_chunk) override {
        messages.push_back(message);
        session_ids.push_back(session_id);

        std::vector<std::string> chunks = index_ < scripts_.size() ? scripts_[index_] : std::vector<std::string>{"Okay."};
        index_++;

        for (size_t i = 0; i < chunks.size(); ++i) {
            if (fail_at_chunk >= 0 && static_cast<size_t>(fail_at_chunk) == i) {
                throw ChatError("stream dropped");
            }
            delivered++;
            if (!on_chunk(chunks[i])) {
                stopped_by_consumer = true;
                return;
            }
        }
    }

    std::vector<std::string> messages;
    std::vector<std::string> session_ids;
    int delivered = 0;
    bool stopped_by_consumer = false;

private:
    std::vector<std::vector<std::string>> scripts_;
    size_t index_ = 0;
};

/// Records what was spoken; on_speak runs inside speak() on the caller's thread.
class RecordingTts : public TextToSpeech {
public:
    std::function<void(const std::string&)> on_speak;
    std::optional<std::string> fail_on;

    void speak(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            spoken_.push_back(text);
        }
        if (fail_on && *fail_on == text) {
            throw SpeechError("speaker disconnected");
        }
        if (on_speak) {
            on_speak(text);
        }
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_count_++;
        }
        cv_.notify_all();
    }

    bool waitForStop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return stop_count_ > 0; });
    }

    std::vector<std::string> spoken() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken_;
    }

    int stopCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> spoken_;
    int stop_count_ = 0;
};

class RecordingFeedback : public AudioFeedback {
public:
    void play(Cue cue) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cues_.push_back(cue);
    }

    std::vector<Cue> cues() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cues_;
    }

    bool played(Cue cue) const {
        auto all = cues();
        return std::find(all.begin(), all.end(), cue) != all.end();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Cue> cues_;
};

} // namespace parley::testing
