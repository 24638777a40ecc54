/**
 * Config.cpp - Settings loading with nlohmann/json and the process environment
 */

#include "parley/Config.hpp"
#include "parley/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string strip(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

double parseNumber(const std::string& name, const std::string& text) {
    const std::string value = strip(text);
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be a number, got '" + text + "'");
    }
    if (consumed != value.size() || !std::isfinite(result)) {
        throw ConfigError(name + " must be a number, got '" + text + "'");
    }
    return result;
}

// Bounds for every numeric setting; integer casts downstream rely on them
struct Range {
    double min;
    double max;
};

constexpr Range kTimeoutRange{0.0, 3600.0};         // seconds
constexpr Range kThresholdRange{0.0, 1.0};          // mean absolute amplitude
constexpr Range kRecordRange{0.0, 3600.0};          // seconds
constexpr Range kSilenceRange{0.0, 60000.0};        // milliseconds

void checkRange(const std::string& name, double value, Range range) {
    if (!std::isfinite(value) || value < range.min || value > range.max) {
        std::ostringstream message;
        message << name << " must be between " << range.min << " and " << range.max;
        throw ConfigError(message.str());
    }
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = strip(text.substr(start, comma - start));
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

// Copies a typed JSON member into target; wrong types are reported and skipped.
template <typename T>
void readKey(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const json::exception&) {
        std::cerr << "[Config] Ignoring '" << key << "': unexpected type " << it->type_name() << std::endl;
    }
}

} // anonymous namespace

RunMode parseRunMode(const std::string& text) {
    const std::string mode = lower(strip(text));
    if (mode == "console") return RunMode::Console;
    if (mode == "audio") return RunMode::Audio;
    throw ConfigError("mode must be 'console' or 'audio', got '" + text + "'");
}

const char* runModeName(RunMode mode) {
    return mode == RunMode::Audio ? "audio" : "console";
}

SttMode parseSttMode(const std::string& text) {
    const std::string mode = lower(strip(text));
    if (mode == "local") return SttMode::Local;
    if (mode == "remote") return SttMode::Remote;
    throw ConfigError("stt mode must be 'local' or 'remote', got '" + text + "'");
}

const char* sttModeName(SttMode mode) {
    return mode == SttMode::Remote ? "remote" : "local";
}

bool parseBool(const std::string& text) {
    const std::string value = lower(strip(text));
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

void Config::applyFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("cannot read config file: " + path);
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw ConfigError("config file is not a JSON object: " + path);
    }

    std::string mode_text;
    readKey(root, "mode", mode_text);
    if (!mode_text.empty()) {
        mode = parseRunMode(mode_text);
    }

    readKey(root, "api_base_url", api_base_url);
    readKey(root, "api_key", api_key);
    readKey(root, "request_timeout", request_timeout);
    readKey(root, "gateway_url", gateway_url);
    readKey(root, "gateway_token", gateway_token);
    readKey(root, "agent_id", agent_id);
    readKey(root, "system_prompt", system_prompt);
    readKey(root, "conversation_id", conversation_id);
    readKey(root, "debug", debug);

    readKey(root, "wake_word", wake_word);
    std::string language_text;
    readKey(root, "language", language_text);
    if (!language_text.empty()) {
        language = language_text;
    }
    readKey(root, "follow_up_timeout", follow_up_timeout);
    double threshold = interrupt_threshold;
    readKey(root, "interrupt_threshold", threshold);
    checkRange("interrupt_threshold", threshold, kThresholdRange);
    interrupt_threshold = static_cast<float>(threshold);
    readKey(root, "allow_interruption", allow_interruption);
    readKey(root, "audio_feedback", audio_feedback);

    std::string stt_mode_text;
    readKey(root, "stt_mode", stt_mode_text);
    if (!stt_mode_text.empty()) {
        stt_mode = parseSttMode(stt_mode_text);
    }
    readKey(root, "whisper_model", whisper_model);
    readKey(root, "whisper_url", whisper_url);
    readKey(root, "tts_url", tts_url);
    readKey(root, "tts_speaker", tts_speaker);
    readKey(root, "record_seconds", record_seconds);
    double silence = silence_ms;
    readKey(root, "silence_ms", silence);
    checkRange("silence_ms", silence, kSilenceRange);
    silence_ms = static_cast<int>(silence);

    readKey(root, "porcupine_key_file", porcupine_key_file);
    readKey(root, "porcupine_model", porcupine_model);
    readKey(root, "wake_keywords", wake_keywords);

    readKey(root, "verbose", verbose);

    validate();

    std::cout << "[Config] Loaded " << path << std::endl;
}

void Config::applyEnvironment(const EnvLookup& env) {
    auto text = [&](const char* name, std::string& target) {
        if (auto value = env(name)) {
            target = *value;
        }
    };
    // Parsed and range-checked; nullopt when unset or blank
    auto number = [&](const char* name, Range range) -> std::optional<double> {
        auto value = env(name);
        if (!value || strip(*value).empty()) return std::nullopt;
        const double parsed = parseNumber(name, *value);
        checkRange(name, parsed, range);
        return parsed;
    };
    auto flag = [&](const char* name, bool& target) {
        if (auto value = env(name); value && !strip(*value).empty()) {
            target = parseBool(*value);
        }
    };

    if (auto value = env("PARLEY_MODE"); value && !strip(*value).empty()) {
        try {
            mode = parseRunMode(*value);
        } catch (const ConfigError& e) {
            throw ConfigError(std::string("PARLEY_MODE: ") + e.what());
        }
    }

    text("PARLEY_API_BASE_URL", api_base_url);
    text("PARLEY_API_KEY", api_key);
    if (auto value = number("PARLEY_REQUEST_TIMEOUT", kTimeoutRange)) request_timeout = *value;
    text("PARLEY_GATEWAY_URL", gateway_url);
    text("PARLEY_GATEWAY_TOKEN", gateway_token);
    text("PARLEY_AGENT_ID", agent_id);
    text("PARLEY_SYSTEM_PROMPT", system_prompt);
    text("PARLEY_CONVERSATION_ID", conversation_id);
    flag("PARLEY_DEBUG", debug);

    text("PARLEY_WAKE_WORD", wake_word);
    if (auto value = env("PARLEY_LANGUAGE")) {
        std::string lang = strip(*value);
        language = lang.empty() ? std::nullopt : std::optional<std::string>(lang);
    }
    if (auto value = number("PARLEY_FOLLOW_UP_TIMEOUT", kTimeoutRange)) follow_up_timeout = *value;
    if (auto value = number("PARLEY_INTERRUPT_THRESHOLD", kThresholdRange)) {
        interrupt_threshold = static_cast<float>(*value);
    }
    flag("PARLEY_ALLOW_INTERRUPTION", allow_interruption);
    flag("PARLEY_AUDIO_FEEDBACK", audio_feedback);

    if (auto value = env("PARLEY_STT_MODE"); value && !strip(*value).empty()) {
        try {
            stt_mode = parseSttMode(*value);
        } catch (const ConfigError& e) {
            throw ConfigError(std::string("PARLEY_STT_MODE: ") + e.what());
        }
    }
    text("PARLEY_WHISPER_MODEL", whisper_model);
    text("PARLEY_WHISPER_URL", whisper_url);
    text("PARLEY_TTS_URL", tts_url);
    text("PARLEY_TTS_SPEAKER", tts_speaker);
    if (auto value = number("PARLEY_RECORD_SECONDS", kRecordRange)) record_seconds = *value;
    if (auto value = number("PARLEY_SILENCE_MS", kSilenceRange)) {
        silence_ms = static_cast<int>(*value);
    }

    text("PARLEY_PORCUPINE_KEY_FILE", porcupine_key_file);
    text("PARLEY_PORCUPINE_MODEL", porcupine_model);
    if (auto value = env("PARLEY_WAKE_KEYWORDS")) {
        wake_keywords = splitList(*value);
    }

    flag("PARLEY_VERBOSE", verbose);

    // Trailing slashes would double up when endpoint paths are appended
    while (!api_base_url.empty() && api_base_url.back() == '/') api_base_url.pop_back();
    while (!gateway_url.empty() && gateway_url.back() == '/') gateway_url.pop_back();
    while (!tts_url.empty() && tts_url.back() == '/') tts_url.pop_back();
    while (!whisper_url.empty() && whisper_url.back() == '/') whisper_url.pop_back();
    wake_word = strip(wake_word);
}

void Config::validate() const {
    checkRange("request_timeout", request_timeout, kTimeoutRange);
    checkRange("follow_up_timeout", follow_up_timeout, kTimeoutRange);
    checkRange("interrupt_threshold", interrupt_threshold, kThresholdRange);
    checkRange("record_seconds", record_seconds, kRecordRange);
    checkRange("silence_ms", silence_ms, kSilenceRange);
}

Config Config::load(const std::optional<std::string>& file, const EnvLookup& env) {
    Config config;

    std::optional<std::string> path = file;
    if (!path) {
        if (auto from_env = env("PARLEY_CONFIG"); from_env && !from_env->empty()) {
            path = from_env;
        }
    }

    if (path) {
        config.applyFile(*path);
    }

    config.applyEnvironment(env);
    return config;
}

EnvLookup Config::processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

} // namespace parley
