/**
 * KeywordWakeWordDetector.hpp - Line-based wake trigger for terminals
 */

#pragma once

#include "parley/Capabilities.hpp"

#include <iosfwd>
#include <string>

namespace parley::wakeword {

/**
 * Reads lines until one wakes the assistant: an empty line (Enter) or a line
 * containing the keyword, case-insensitive. "exit", "quit", "q" or end of
 * input request shutdown. Anything else is ignored.
 */
class KeywordWakeWordDetector : public WakeWordDetector {
public:
    KeywordWakeWordDetector(std::istream& in, std::ostream& out, std::string keyword);

    bool awaitWake() override;

    const std::string& keyword() const { return keyword_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::string keyword_;
};

} // namespace parley::wakeword
