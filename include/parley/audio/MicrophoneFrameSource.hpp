/**
 * MicrophoneFrameSource.hpp - Pull-based microphone frames over AudioEngine
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/FrameQueue.hpp"

#include <mutex>

namespace parley::audio {

/**
 * The PortAudio callback regroups captured blocks into fixed-size frames and
 * pushes them into a bounded FrameQueue. open() fails while another reader
 * holds the stream.
 */
class MicrophoneFrameSource : public AudioFrameSource {
public:
    explicit MicrophoneFrameSource(AudioEngine& engine,
                                   size_t frame_samples = kDefaultFrameSamples,
                                   size_t queue_capacity = 64);
    ~MicrophoneFrameSource() override;

    bool open() override;
    std::optional<AudioFrame> nextFrame(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    void onSamples(const float* samples, size_t count);

    AudioEngine& engine_;
    size_t frame_samples_;
    FrameQueue queue_;
    bool open_ = false;

    std::mutex pending_mutex_;
    AudioFrame pending_;
};

} // namespace parley::audio
