/**
 * ConsoleRecorder.hpp - Typed input standing in for a microphone
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <iosfwd>

namespace parley::audio {

class ConsoleRecorder : public AudioRecorder {
public:
    ConsoleRecorder(std::istream& in, std::ostream& out);

    /// Prompts, reads one line and returns it as the transcript hint.
    CapturedUtterance record() override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace parley::audio
