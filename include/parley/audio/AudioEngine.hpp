/**
 * AudioEngine.hpp - PortAudio device access for capture and playback
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley::audio {

struct AudioConfig {
    int sample_rate = 16000;       // capture rate
    int channels = 1;
    int frames_per_buffer = 512;
    int input_device = -1;         // -1 = default device
    int output_device = -1;
};

/// Called on the PortAudio thread with each captured block.
using AudioCallback = std::function<void(const float* samples, size_t count)>;

/**
 * Owns the PortAudio library lifetime plus at most one input stream and one
 * output stream. The input stream has a single reader: openInput() fails
 * while another reader holds it.
 */
class AudioEngine {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();

    bool openInput(AudioCallback callback);
    void closeInput();
    bool isInputOpen() const;

    /**
     * Play a mono clip and block until it has drained or stopPlayback() is called.
     * @return false if playback failed or was stopped early
     */
    bool play(const float* samples, size_t count, int sample_rate);

    /**
     * As above, but any stopPlayback() issued after `epoch` was read from
     * playbackEpoch() applies, including one that lands before playback starts.
     */
    bool play(const float* samples, size_t count, int sample_rate, uint64_t epoch);

    /// Halt the current play() call. Safe from any thread.
    void stopPlayback();

    /// Number of stopPlayback() calls so far.
    uint64_t playbackEpoch() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace parley::audio
