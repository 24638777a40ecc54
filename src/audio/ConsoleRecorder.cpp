/**
 * ConsoleRecorder.cpp - Typed input recorder
 */

#include "parley/audio/ConsoleRecorder.hpp"

#include <iostream>
#include <string>

namespace parley::audio {

ConsoleRecorder::ConsoleRecorder(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out)
{
}

CapturedUtterance ConsoleRecorder::record() {
    CapturedUtterance utterance;

    out_ << "You: " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        out_ << std::endl;
        utterance.transcript_hint = std::string();
        return utterance;
    }

    utterance.transcript_hint = line;
    return utterance;
}

} // namespace parley::audio
