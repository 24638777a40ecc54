/**
 * InterruptionMonitor.hpp - Barge-in detection while the assistant is speaking
 */

#pragma once

#include "parley/Capabilities.hpp"
#include "parley/core/CancellationSignal.hpp"
#include "parley/core/FrameStream.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace parley::core {

struct MonitorOptions {
    float threshold = kSpeechEnergyThreshold;
    std::chrono::milliseconds poll_interval{50};
};

/**
 * Scoped background task that watches the microphone for the lifetime of
 * the object. The first frame louder than the threshold fires the signal and
 * runs the interrupt handler (typically TextToSpeech::stop); after that the
 * monitor ignores all input until destroyed.
 *
 * Construction opens the input and starts the thread; destruction stops and
 * joins the thread and closes the input, whichever way the window ends.
 * Without a usable input the monitor is a no-op.
 */
class InterruptionMonitor {
public:
    using InterruptHandler = std::function<void()>;

    InterruptionMonitor(AudioFrameSource* source,
                        CancellationSignal& signal,
                        InterruptHandler on_interrupt = {},
                        MonitorOptions options = {});
    ~InterruptionMonitor();

    InterruptionMonitor(const InterruptionMonitor&) = delete;
    InterruptionMonitor& operator=(const InterruptionMonitor&) = delete;

    /// false when running as a no-op (no input device)
    bool isWatching() const { return thread_.joinable(); }

private:
    void run();
    void interrupt(float level);

    AudioFrameSource* source_;
    CancellationSignal& signal_;
    InterruptHandler on_interrupt_;
    MonitorOptions options_;

    ScopedFrameStream stream_;
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;
};

} // namespace parley::core
