/**
 * Types.hpp - Value types shared by the turn-taking engine and its collaborators
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace parley {

constexpr int kDefaultSampleRate = 16000;
constexpr size_t kDefaultFrameSamples = 512;

/// One short block of mono float samples in [-1, 1].
using AudioFrame = std::vector<float>;

/**
 * One recorded user utterance. Produced once by an AudioRecorder and consumed
 * once by SpeechToText; passed by const reference so it stays immutable.
 */
struct CapturedUtterance {
    std::vector<float> samples;
    int sample_rate = kDefaultSampleRate;

    // Typed text standing in for audio (console harness)
    std::optional<std::string> transcript_hint;

    double durationSeconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/// Whole reply returned by ChatClient::chat().
struct ChatReply {
    std::string text;
    std::optional<std::string> session_id;
};

/**
 * Outcome of one InteractionCycle.
 */
struct TurnResult {
    enum class Outcome {
        Completed,
        Aborted
    };

    Outcome outcome = Outcome::Completed;
    bool interrupted = false;
    std::string error;

    static TurnResult completed(bool interrupted) {
        TurnResult result;
        result.interrupted = interrupted;
        return result;
    }

    static TurnResult aborted(std::string error) {
        TurnResult result;
        result.outcome = Outcome::Aborted;
        result.error = std::move(error);
        return result;
    }

    bool isAborted() const { return outcome == Outcome::Aborted; }
};

} // namespace parley
