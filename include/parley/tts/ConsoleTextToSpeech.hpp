/**
 * ConsoleTextToSpeech.hpp - Prints replies instead of speaking them
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <iosfwd>
#include <mutex>

namespace parley::tts {

class ConsoleTextToSpeech : public TextToSpeech {
public:
    explicit ConsoleTextToSpeech(std::ostream& out);

    void speak(const std::string& text) override;
    void stop() override {}

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace parley::tts
