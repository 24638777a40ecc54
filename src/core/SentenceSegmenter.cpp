/**
 * SentenceSegmenter.cpp - Incremental sentence extraction for streamed replies
 */

#include "parley/core/SentenceSegmenter.hpp"

#include <cctype>

namespace parley::core {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string SentenceSegmenter::trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

size_t SentenceSegmenter::findSentenceEnd() const {
    size_t i = 0;
    while (i < buffer_.size()) {
        if (!isTerminal(buffer_[i])) {
            ++i;
            continue;
        }

        // Consume the whole run so "?!" or "..." stays with its sentence
        size_t run_end = i;
        while (run_end < buffer_.size() && isTerminal(buffer_[run_end])) {
            ++run_end;
        }

        // A run at the very end may still grow ("..." or "3.14"); wait for more text
        if (run_end == buffer_.size()) {
            return std::string::npos;
        }
        if (isSpace(buffer_[run_end])) {
            return run_end;
        }
        i = run_end;
    }
    return std::string::npos;
}

std::vector<std::string> SentenceSegmenter::add(const std::string& fragment) {
    std::vector<std::string> sentences;
    if (fragment.empty()) {
        return sentences;
    }

    buffer_ += fragment;

    size_t end;
    while ((end = findSentenceEnd()) != std::string::npos) {
        std::string sentence = trim(buffer_.substr(0, end));

        size_t next = end;
        while (next < buffer_.size() && isSpace(buffer_[next])) ++next;
        buffer_.erase(0, next);

        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
    }

    return sentences;
}

std::string SentenceSegmenter::flush() {
    std::string remaining = trim(buffer_);
    buffer_.clear();
    return remaining;
}

} // namespace parley::core
