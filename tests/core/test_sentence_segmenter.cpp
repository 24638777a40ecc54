/**
 * test_sentence_segmenter.cpp - Sentence extraction from streamed fragments
 */

#include "parley/core/SentenceSegmenter.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace parley::core;

using Sentences = std::vector<std::string>;

void test_split_across_fragments() {
    SentenceSegmenter seg;

    assert(seg.add("Hello there. How are") == Sentences({"Hello there."}));
    assert(seg.add(" you? I'm good!") == Sentences({"How are you?"}));
    assert(seg.flush() == "I'm good!");
    assert(seg.pending().empty());

    std::cout << "[PASS] test_split_across_fragments" << std::endl;
}

void test_no_terminal_punctuation() {
    SentenceSegmenter seg;

    assert(seg.add("Hello world").empty());
    assert(seg.flush() == "Hello world");

    std::cout << "[PASS] test_no_terminal_punctuation" << std::endl;
}

void test_terminal_run_stays_together() {
    SentenceSegmenter seg;

    auto out = seg.add("Really?! Yes... Fine. ");
    assert(out == Sentences({"Really?!", "Yes...", "Fine."}));
    assert(seg.flush().empty());

    std::cout << "[PASS] test_terminal_run_stays_together" << std::endl;
}

void test_trailing_mark_held_until_whitespace() {
    SentenceSegmenter seg;

    assert(seg.add("Pi is 3.").empty());
    assert(seg.add("14 exactly. Next").size() == 1);
    assert(seg.flush() == "Next");

    SentenceSegmenter chunks;
    assert(chunks.add("Hi").empty());
    assert(chunks.add(" there.").empty());
    assert(chunks.add(" How are you?") == Sentences({"Hi there."}));
    assert(chunks.flush() == "How are you?");

    std::cout << "[PASS] test_trailing_mark_held_until_whitespace" << std::endl;
}

void test_empty_fragments() {
    SentenceSegmenter seg;

    assert(seg.add("").empty());
    assert(seg.add("   ").empty());
    assert(seg.add("\n\t").empty());
    assert(seg.flush().empty());

    std::cout << "[PASS] test_empty_fragments" << std::endl;
}

void test_reconstruction_any_split() {
    const std::string text = "The cat sat. It purred loudly! Did it sleep? Yes.";
    const Sentences expected = {"The cat sat.", "It purred loudly!", "Did it sleep?", "Yes."};

    for (size_t chunk = 1; chunk <= text.size(); ++chunk) {
        SentenceSegmenter seg;
        Sentences got;
        for (size_t i = 0; i < text.size(); i += chunk) {
            for (auto& s : seg.add(text.substr(i, chunk))) {
                got.push_back(s);
            }
        }
        std::string tail = seg.flush();
        if (!tail.empty()) got.push_back(tail);
        assert(got == expected);
    }

    std::cout << "[PASS] test_reconstruction_any_split" << std::endl;
}

int main() {
    std::cout << "=== SentenceSegmenter Tests ===" << std::endl;

    test_split_across_fragments();
    test_no_terminal_punctuation();
    test_terminal_run_stays_together();
    test_trailing_mark_held_until_whitespace();
    test_empty_fragments();
    test_reconstruction_any_split();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
