/**
 * ConsoleTextToSpeech.cpp - Text output
 */

#include "parley/tts/ConsoleTextToSpeech.hpp"

#include <ostream>

namespace parley::tts {

ConsoleTextToSpeech::ConsoleTextToSpeech(std::ostream& out)
    : out_(out)
{
}

void ConsoleTextToSpeech::speak(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "Assistant: " << text << std::endl;
}

} // namespace parley::tts
