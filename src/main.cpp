/**
 * Parley - Main Entry Point
 *
 * Hands-free voice conversation loop: wake word, listen, answer out loud,
 * keep listening for follow-ups, and stop talking when interrupted.
 */

#include "parley/Capabilities.hpp"
#include "parley/Config.hpp"
#include "parley/Errors.hpp"
#include "parley/SessionController.hpp"
#include "parley/audio/AudioCues.hpp"
#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/ConsoleRecorder.hpp"
#include "parley/audio/MicrophoneFrameSource.hpp"
#include "parley/audio/MicrophoneRecorder.hpp"
#include "parley/chat/GatewayChatClient.hpp"
#include "parley/chat/HttpChatClient.hpp"
#include "parley/core/FollowUpListener.hpp"
#include "parley/core/InteractionCycle.hpp"
#include "parley/stt/EchoSpeechToText.hpp"
#include "parley/stt/RemoteSpeechToText.hpp"
#include "parley/stt/WhisperSpeechToText.hpp"
#include "parley/tts/ConsoleTextToSpeech.hpp"
#include "parley/tts/RemoteTextToSpeech.hpp"
#include "parley/wakeword/KeywordWakeWordDetector.hpp"

#ifdef PARLEY_HAS_PORCUPINE
#include "parley/wakeword/PorcupineWakeWordDetector.hpp"
#endif

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace parley;

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    if (!g_running.exchange(false)) {
        std::_Exit(130);   // second Ctrl+C
    }
}

// No SA_RESTART: a blocked console read returns and the loop winds down
void installSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/// Reports shutdown once a termination signal has arrived.
class ShutdownAwareWake : public WakeWordDetector {
public:
    explicit ShutdownAwareWake(WakeWordDetector& inner) : inner_(inner) {}

    bool awaitWake() override {
        if (!g_running) return false;
        const bool woke = inner_.awaitWake();
        return woke && g_running;
    }

private:
    WakeWordDetector& inner_;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <file>] [--mode console|audio] [--list-devices] [--help]\n"
              << "\n"
              << "Settings come from defaults, then the JSON config file (--config or PARLEY_CONFIG),\n"
              << "then PARLEY_* environment variables." << std::endl;
}

struct Arguments {
    std::optional<std::string> config_file;
    std::optional<std::string> mode;
    bool list_devices = false;
    bool help = false;
};

// false on a malformed command line
bool parseArguments(int argc, char* argv[], Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--list-devices") {
            args.list_devices = true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else {
            std::cerr << "[Main] Unknown or incomplete argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

void listDevices() {
    std::cout << "Input devices:" << std::endl;
    for (const auto& name : audio::AudioEngine::listInputDevices()) {
        std::cout << "  " << name << std::endl;
    }
    std::cout << "Output devices:" << std::endl;
    for (const auto& name : audio::AudioEngine::listOutputDevices()) {
        std::cout << "  " << name << std::endl;
    }
}

#ifdef PARLEY_HAS_PORCUPINE
std::string readKeyFile(const std::string& path) {
    std::ifstream file(path);
    std::string key;
    std::getline(file, key);
    size_t end = key.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : key.substr(0, end + 1);
}
#endif

/**
 * Everything the controller talks to. Members are declared in dependency
 * order so destruction tears down adapters before the audio engine.
 */
struct Wiring {
    std::unique_ptr<audio::AudioEngine> engine;
    std::unique_ptr<audio::MicrophoneFrameSource> microphone;
    std::unique_ptr<audio::AudioCues> cues;

    std::unique_ptr<AudioRecorder> recorder;
    std::unique_ptr<SpeechToText> stt;
    std::unique_ptr<TextToSpeech> tts;
    std::unique_ptr<WakeWordDetector> wake;

    std::unique_ptr<chat::HttpChatClient> http_chat;
    std::unique_ptr<chat::GatewayChatClient> gateway_chat;

    ChatBackend backend() const {
        if (gateway_chat) return ChatBackend(*gateway_chat);
        return ChatBackend(*http_chat);
    }
};

void wireChat(const Config& config, Wiring& w) {
    const int timeout = static_cast<int>(config.request_timeout + 0.5);

    if (config.useGateway()) {
        chat::GatewayOptions options;
        options.gateway_url = config.gateway_url;
        options.token = config.gateway_token;
        options.agent_id = config.agent_id;
        options.system_prompt = config.system_prompt;
        options.timeout_seconds = std::max(timeout, 30);
        options.verbose = config.verbose;
        w.gateway_chat = std::make_unique<chat::GatewayChatClient>(options);
    } else {
        chat::HttpChatOptions options;
        options.base_url = config.api_base_url;
        options.api_key = config.api_key;
        options.timeout_seconds = std::max(timeout, 1);
        w.http_chat = std::make_unique<chat::HttpChatClient>(options);
    }
}

void wireConsole(const Config& config, Wiring& w) {
    w.recorder = std::make_unique<audio::ConsoleRecorder>(std::cin, std::cout);
    w.stt = std::make_unique<stt::EchoSpeechToText>();
    w.tts = std::make_unique<tts::ConsoleTextToSpeech>(std::cout);
    w.wake = std::make_unique<wakeword::KeywordWakeWordDetector>(std::cin, std::cout, config.wake_word);
}

// false when a required device or model is missing
bool wireAudio(const Config& config, Wiring& w) {
    w.engine = std::make_unique<audio::AudioEngine>();
    if (!w.engine->initialize()) {
        std::cerr << "[Main] Audio unavailable: " << w.engine->lastError() << std::endl;
        return false;
    }

    w.microphone = std::make_unique<audio::MicrophoneFrameSource>(*w.engine);

    audio::RecorderOptions recorder_options;
    recorder_options.max_seconds = std::max(1, static_cast<int>(config.record_seconds));
    recorder_options.silence_ms = config.silence_ms;
    w.recorder = std::make_unique<audio::MicrophoneRecorder>(*w.microphone, recorder_options);

    if (config.stt_mode == SttMode::Remote) {
        if (config.whisper_url.empty()) {
            std::cerr << "[Main] PARLEY_WHISPER_URL must be set when PARLEY_STT_MODE=remote" << std::endl;
            return false;
        }
        stt::RemoteSttOptions stt_options;
        stt_options.base_url = config.whisper_url;
        stt_options.timeout_seconds = std::max(static_cast<int>(config.request_timeout + 0.5), 30);
        w.stt = std::make_unique<stt::RemoteSpeechToText>(stt_options);
    } else {
        auto whisper = std::make_unique<stt::WhisperSpeechToText>(config.whisper_model);
        if (!whisper->isReady()) {
            std::cerr << "[Main] Whisper model missing: " << config.whisper_model << std::endl;
            return false;
        }
        w.stt = std::move(whisper);
    }

    tts::RemoteTtsOptions tts_options;
    tts_options.base_url = config.tts_url;
    tts_options.speaker = config.tts_speaker;
    auto speaker = std::make_unique<tts::RemoteTextToSpeech>(*w.engine, tts_options);
    if (!speaker->isHealthy()) {
        std::cerr << "[Main] Synthesis server not responding at " << config.tts_url << "/health" << std::endl;
    }
    w.tts = std::move(speaker);

    if (config.audio_feedback) {
        w.cues = std::make_unique<audio::AudioCues>(*w.engine);
    }

#ifdef PARLEY_HAS_PORCUPINE
    if (!config.wake_keywords.empty() && !config.porcupine_key_file.empty()) {
        wakeword::PorcupineOptions porcupine;
        porcupine.access_key = readKeyFile(config.porcupine_key_file);
        porcupine.model_path = config.porcupine_model;
        porcupine.keyword_paths = config.wake_keywords;

        auto detector = std::make_unique<wakeword::PorcupineWakeWordDetector>(*w.microphone, porcupine, g_running);
        if (detector->isReady()) {
            w.wake = std::move(detector);
            return true;
        }
        std::cerr << "[Main] Porcupine unavailable, falling back to typed wake word" << std::endl;
    }
#else
    if (!config.wake_keywords.empty()) {
        std::cerr << "[Main] Built without Porcupine (key file " << config.porcupine_key_file
                  << " unused), using typed wake word" << std::endl;
    }
#endif

    w.wake = std::make_unique<wakeword::KeywordWakeWordDetector>(std::cin, std::cout, config.wake_word);
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    installSignalHandlers();

    Arguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage(argv[0]);
        return 2;
    }
    if (args.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (args.list_devices) {
        listDevices();
        return 0;
    }

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║                 PARLEY v0.1.0                 ║
    ║      Hands-free voice conversation loop       ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    Config config;
    try {
        config = Config::load(args.config_file, Config::processEnvironment());
        if (args.mode) {
            config.mode = parseRunMode(*args.mode);
        }
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 2;
    }

    std::cout << "[Main] Mode: " << runModeName(config.mode)
              << ", backend: " << (config.useGateway() ? config.gateway_url : config.api_base_url);
    if (config.mode == RunMode::Audio) {
        std::cout << ", stt: " << sttModeName(config.stt_mode);
    }
    std::cout << std::endl;

    try {
        Wiring w;
        wireChat(config, w);

        if (config.mode == RunMode::Audio) {
            if (!wireAudio(config, w)) {
                return 1;
            }
        } else {
            wireConsole(config, w);
        }

        core::CycleOptions cycle_options;
        cycle_options.language = config.language;
        cycle_options.debug = config.debug;
        cycle_options.allow_interruption = config.allow_interruption;
        cycle_options.interrupt_threshold = config.interrupt_threshold;

        core::InteractionCycle cycle(
            core::CycleCollaborators{*w.recorder, *w.stt, w.backend(), *w.tts, w.microphone.get(), w.cues.get()},
            cycle_options);

        core::ListenerOptions listener_options;
        listener_options.threshold = config.interrupt_threshold;
        core::FollowUpListener follow_up(w.microphone.get(), listener_options);

        ShutdownAwareWake wake(*w.wake);

        ControllerOptions controller_options;
        controller_options.follow_up_timeout = std::chrono::milliseconds(
            static_cast<long long>(config.follow_up_timeout * 1000.0));
        controller_options.preset_session_id = config.conversation_id;

        SessionController controller(wake, cycle, follow_up, controller_options);
        controller.run();
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[Main] Goodbye!" << std::endl;
    return 0;
}
