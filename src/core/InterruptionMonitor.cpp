/**
 * InterruptionMonitor.cpp - Mic energy gate that cancels speech playback
 */

#include "parley/core/InterruptionMonitor.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace parley::core {

InterruptionMonitor::InterruptionMonitor(AudioFrameSource* source,
                                         CancellationSignal& signal,
                                         InterruptHandler on_interrupt,
                                         MonitorOptions options)
    : source_(source)
    , signal_(signal)
    , on_interrupt_(std::move(on_interrupt))
    , options_(options)
    , stream_(source, "InterruptionMonitor")
{
    if (!stream_.isOpen()) {
        std::cout << "[InterruptionMonitor] Interruption disabled for this window" << std::endl;
        return;
    }

    // stream_ closes the input if the thread cannot be started
    thread_ = std::thread([this]() { run(); });
}

InterruptionMonitor::~InterruptionMonitor() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    stream_.close();
}

void InterruptionMonitor::run() {
    while (!stop_requested_) {
        std::optional<AudioFrame> frame;
        try {
            frame = source_->nextFrame(options_.poll_interval);
        } catch (const std::exception& e) {
            std::cerr << "[InterruptionMonitor] Audio input failed: " << e.what() << std::endl;
            return;
        }

        if (!frame || frame->empty()) {
            continue;
        }

        if (signal_.isSet()) {
            return;
        }

        float level = meanAbsoluteAmplitude(*frame);
        if (level > options_.threshold) {
            interrupt(level);
            return;
        }
    }
}

void InterruptionMonitor::interrupt(float level) {
    if (!signal_.fire()) {
        return;
    }

    std::cout << "\n[InterruptionMonitor] Interrupted by user speech (level=" << level << ")" << std::endl;

    if (!on_interrupt_) {
        return;
    }

    try {
        on_interrupt_();
    } catch (const std::exception& e) {
        std::cerr << "[InterruptionMonitor] Stop request failed: " << e.what() << std::endl;
    }
}

} // namespace parley::core
