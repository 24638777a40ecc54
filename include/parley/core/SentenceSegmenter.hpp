/**
 * SentenceSegmenter.hpp - Splits streamed text fragments into speakable sentences
 */

#pragma once

#include <string>
#include <vector>

namespace parley::core {

/**
 * Buffers text fragments and extracts complete sentences.
 *
 * A sentence ends at a run of '.', '!' or '?' followed by whitespace. A run
 * at the end of the buffer is held until more text arrives; flush() releases
 * it at end of stream. Each instance owns its buffer exclusively.
 *
 *   SentenceSegmenter seg;
 *   seg.add("Hello there. How are");   // {"Hello there."}
 *   seg.add(" you? I'm good!");        // {"How are you?"}
 *   seg.flush();                        // "I'm good!"
 */
class SentenceSegmenter {
public:
    /// Append a fragment and return the sentences it completed, trimmed, in order.
    std::vector<std::string> add(const std::string& fragment);

    /// Return the trimmed remainder (possibly unterminated) and clear the buffer.
    std::string flush();

    const std::string& pending() const { return buffer_; }

    static bool isTerminal(char c) { return c == '.' || c == '!' || c == '?'; }
    static std::string trim(const std::string& text);

private:
    // Index one past the terminal run of the first complete sentence, or npos.
    size_t findSentenceEnd() const;

    std::string buffer_;
};

} // namespace parley::core
