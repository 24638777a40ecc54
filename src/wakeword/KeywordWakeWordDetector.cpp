/**
 * KeywordWakeWordDetector.cpp - Typed wake phrase
 */

#include "parley/wakeword/KeywordWakeWordDetector.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace parley::wakeword {

namespace {

std::string normalize(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");

    std::string out = text.substr(begin, end - begin + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

KeywordWakeWordDetector::KeywordWakeWordDetector(std::istream& in, std::ostream& out, std::string keyword)
    : in_(in)
    , out_(out)
    , keyword_(normalize(keyword))
{
}

bool KeywordWakeWordDetector::awaitWake() {
    out_ << "[WakeWord] Type \"" << keyword_ << "\" or press ENTER to talk ('exit' to quit)" << std::endl;

    std::string line;
    while (std::getline(in_, line)) {
        const std::string input = normalize(line);

        if (input == "exit" || input == "quit" || input == "q") {
            out_ << "[WakeWord] Exiting..." << std::endl;
            return false;
        }

        if (input.empty() || (!keyword_.empty() && input.find(keyword_) != std::string::npos)) {
            return true;
        }
    }

    out_ << "\n[WakeWord] Input closed" << std::endl;
    return false;
}

} // namespace parley::wakeword
