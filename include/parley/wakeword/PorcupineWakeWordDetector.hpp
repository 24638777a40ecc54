/**
 * PorcupineWakeWordDetector.hpp - On-device wake word detection with Picovoice Porcupine
 *
 * Only built when Porcupine is found (PARLEY_HAS_PORCUPINE).
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace parley::wakeword {

struct PorcupineOptions {
    std::string access_key;
    std::string model_path;
    std::vector<std::string> keyword_paths;   // .ppn files
    std::vector<float> sensitivities;         // default 0.5 each
};

class PorcupineWakeWordDetector : public WakeWordDetector {
public:
    /**
     * @param running awaitWake() returns false once this turns false
     */
    PorcupineWakeWordDetector(AudioFrameSource& source,
                              const PorcupineOptions& options,
                              const std::atomic<bool>& running);
    ~PorcupineWakeWordDetector() override;

    bool awaitWake() override;

    bool isReady() const;

    /// Feed float samples; returns the detected keyword index or -1.
    int processFloat(const float* samples, size_t count);

private:
    AudioFrameSource& source_;
    const std::atomic<bool>& running_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::wakeword
