/**
 * AudioEngine.cpp - PortAudio wrapper implementation
 *
 * Capture streams deliver blocks to a callback (the frame source turns them into
 * pull-based frames). Playback streams are opened per clip at the clip's own
 * sample rate and fed through a lock-free ring buffer.
 */

#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/RingBuffer.hpp"

#include <portaudio.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>

namespace parley::audio {

// Playback ring size (samples): 4 seconds at 48kHz
constexpr size_t PLAYBACK_BUFFER_SIZE = 48000 * 4;

struct AudioEngine::Impl {
    std::atomic<bool> initialized{false};

    PaStream* inputStream = nullptr;
    AudioCallback inputCallback;
    std::mutex callbackMutex;

    RingBuffer<float> playbackBuffer{PLAYBACK_BUFFER_SIZE};
    std::mutex outputMutex;   // one play() at a time
    std::atomic<uint64_t> stopEpoch{0};

    mutable std::mutex errorMutex;
    std::string lastError;

    void setError(const std::string& message) {
        std::cerr << "[AudioEngine] " << message << std::endl;
        std::lock_guard<std::mutex> lock(errorMutex);
        lastError = message;
    }
};

namespace {

/**
 * Closes a PortAudio stream on scope exit, aborting it first if still running.
 */
class ScopedStream {
public:
    explicit ScopedStream(PaStream* stream) : stream_(stream) {}
    ~ScopedStream() {
        if (!stream_) return;
        if (Pa_IsStreamActive(stream_) == 1) {
            Pa_AbortStream(stream_);
        }
        Pa_CloseStream(stream_);
    }

    ScopedStream(const ScopedStream&) = delete;
    ScopedStream& operator=(const ScopedStream&) = delete;

    PaStream* get() const { return stream_; }

private:
    PaStream* stream_;
};

int inputCallback(
    const void* input,
    void* /*output*/,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* /*timeInfo*/,
    PaStreamCallbackFlags /*statusFlags*/,
    void* userData
) {
    auto* impl = static_cast<AudioEngine::Impl*>(userData);
    const float* samples = static_cast<const float*>(input);

    std::lock_guard<std::mutex> lock(impl->callbackMutex);
    if (impl->inputCallback && samples) {
        impl->inputCallback(samples, frameCount);
    }

    return paContinue;
}

int outputCallback(
    const void* /*input*/,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* /*timeInfo*/,
    PaStreamCallbackFlags /*statusFlags*/,
    void* userData
) {
    auto* impl = static_cast<AudioEngine::Impl*>(userData);
    float* out = static_cast<float*>(output);

    size_t read = impl->playbackBuffer.pop(out, frameCount);

    // Zero-fill if not enough data
    if (read < frameCount) {
        std::memset(out + read, 0, (frameCount - read) * sizeof(float));
    }

    return paContinue;
}

} // anonymous namespace

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
}

AudioEngine::~AudioEngine() {
    stopPlayback();
    closeInput();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        return false;
    }

    pImpl_->initialized = true;

    std::cout << "[AudioEngine] Found " << Pa_GetDeviceCount() << " audio devices" << std::endl;

    int defaultInput = Pa_GetDefaultInputDevice();
    int defaultOutput = Pa_GetDefaultOutputDevice();

    if (defaultInput >= 0) {
        std::cout << "[AudioEngine] Default input: " << Pa_GetDeviceInfo(defaultInput)->name << std::endl;
    }
    if (defaultOutput >= 0) {
        std::cout << "[AudioEngine] Default output: " << Pa_GetDeviceInfo(defaultOutput)->name << std::endl;
    }

    return true;
}

bool AudioEngine::openInput(AudioCallback callback) {
    if (pImpl_->inputStream) {
        pImpl_->setError("Input stream already has a reader");
        return false;
    }

    if (!initialize()) {
        return false;
    }

    PaStreamParameters inputParams;
    inputParams.device = (config_.input_device >= 0)
        ? config_.input_device
        : Pa_GetDefaultInputDevice();

    if (inputParams.device == paNoDevice) {
        pImpl_->setError("No input device available");
        return false;
    }

    inputParams.channelCount = config_.channels;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = Pa_GetDeviceInfo(inputParams.device)->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    {
        std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
        pImpl_->inputCallback = std::move(callback);
    }

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(
        &stream,
        &inputParams,
        nullptr,  // No output for this stream
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        inputCallback,
        pImpl_.get()
    );

    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_OpenStream (input) failed: ") + Pa_GetErrorText(err));
        return false;
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_StartStream (input) failed: ") + Pa_GetErrorText(err));
        Pa_CloseStream(stream);
        return false;
    }

    pImpl_->inputStream = stream;
    return true;
}

void AudioEngine::closeInput() {
    if (!pImpl_->inputStream) {
        return;
    }

    Pa_StopStream(pImpl_->inputStream);
    Pa_CloseStream(pImpl_->inputStream);
    pImpl_->inputStream = nullptr;

    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->inputCallback = nullptr;
}

bool AudioEngine::isInputOpen() const {
    return pImpl_->inputStream != nullptr;
}

bool AudioEngine::play(const float* samples, size_t count, int sample_rate) {
    return play(samples, count, sample_rate, playbackEpoch());
}

bool AudioEngine::play(const float* samples, size_t count, int sample_rate, uint64_t epoch) {
    if (pImpl_->stopEpoch.load() != epoch) {
        return false;
    }

    if (count == 0) {
        return true;
    }

    if (!initialize()) {
        return false;
    }

    std::lock_guard<std::mutex> outputLock(pImpl_->outputMutex);
    pImpl_->playbackBuffer.clear();

    PaStreamParameters outputParams;
    outputParams.device = (config_.output_device >= 0)
        ? config_.output_device
        : Pa_GetDefaultOutputDevice();

    if (outputParams.device == paNoDevice) {
        pImpl_->setError("No output device available");
        return false;
    }

    outputParams.channelCount = 1;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = Pa_GetDeviceInfo(outputParams.device)->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* raw = nullptr;
    PaError err = Pa_OpenStream(
        &raw,
        nullptr,  // No input for this stream
        &outputParams,
        sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        outputCallback,
        pImpl_.get()
    );

    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_OpenStream (output) failed: ") + Pa_GetErrorText(err));
        return false;
    }

    ScopedStream stream(raw);

    err = Pa_StartStream(stream.get());
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_StartStream (output) failed: ") + Pa_GetErrorText(err));
        return false;
    }

    size_t offset = 0;
    bool stopped = false;
    while (true) {
        if (pImpl_->stopEpoch.load() != epoch) {
            stopped = true;
            break;
        }

        if (offset < count) {
            offset += pImpl_->playbackBuffer.push(samples + offset, count - offset);
        } else if (pImpl_->playbackBuffer.available() == 0) {
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (stopped) {
        Pa_AbortStream(stream.get());
        pImpl_->playbackBuffer.clear();
    } else {
        // Returns once the device has played what it already pulled
        Pa_StopStream(stream.get());
    }

    return !stopped;
}

void AudioEngine::stopPlayback() {
    pImpl_->stopEpoch++;
}

uint64_t AudioEngine::playbackEpoch() const {
    return pImpl_->stopEpoch.load();
}

std::vector<std::string> AudioEngine::listInputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxOutputChannels > 0) {
            devices.push_back(info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(pImpl_->errorMutex);
    return pImpl_->lastError;
}

} // namespace parley::audio
