/**
 * Config.hpp - Runtime settings: defaults, then a JSON file, then PARLEY_* variables
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace parley {

enum class RunMode {
    Console,   // typed input, printed replies
    Audio      // microphone, speech recognition, spoken replies
};

enum class SttMode {
    Local,     // whisper.cpp in process
    Remote     // HTTP /transcribe service
};

/// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

struct Config {
    RunMode mode = RunMode::Console;

    // Chat backend
    std::string api_base_url = "http://localhost:8000";
    std::string api_key;
    double request_timeout = 10.0;              // seconds
    std::string gateway_url;                    // set -> streaming gateway client
    std::string gateway_token;
    std::string agent_id = "main";
    std::string system_prompt;
    std::string conversation_id;                // preset session id
    bool debug = false;

    // Turn taking
    std::string wake_word = "hey parley";
    std::optional<std::string> language;
    double follow_up_timeout = 12.0;            // seconds
    float interrupt_threshold = 0.02f;
    bool allow_interruption = true;
    bool audio_feedback = true;

    // Audio services
    SttMode stt_mode = SttMode::Local;
    std::string whisper_model = "models/whisper/ggml-small-q5_1.bin";
    std::string whisper_url;                    // required when stt_mode is Remote
    std::string tts_url = "http://localhost:5050";
    std::string tts_speaker;
    double record_seconds = 30.0;
    int silence_ms = 1200;

    // Porcupine (optional)
    std::string porcupine_key_file;
    std::string porcupine_model;
    std::vector<std::string> wake_keywords;

    bool verbose = false;

    bool useGateway() const { return !gateway_url.empty(); }

    /**
     * Overlay a JSON object file. Unknown keys are ignored; a key with the
     * wrong type is reported and the current value kept.
     * @throws ConfigError if the file cannot be read, is not a JSON object,
     *         or sets a number outside its allowed range
     */
    void applyFile(const std::string& path);

    /// @throws ConfigError naming the variable when a value is malformed or out of range
    void applyEnvironment(const EnvLookup& env);

    /// @throws ConfigError naming the first numeric setting that is not finite or out of range
    void validate() const;

    /// Defaults, then file (if any), then environment.
    static Config load(const std::optional<std::string>& file, const EnvLookup& env);

    static EnvLookup processEnvironment();
};

RunMode parseRunMode(const std::string& text);
const char* runModeName(RunMode mode);

SttMode parseSttMode(const std::string& text);
const char* sttModeName(SttMode mode);

/// "1", "true", "yes", "on" (any case) are true; anything else false.
bool parseBool(const std::string& text);

} // namespace parley
