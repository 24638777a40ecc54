/**
 * test_ring_buffer.cpp - Playback ring buffer
 */

#include "parley/audio/RingBuffer.hpp"

#include <atomic>
#include <cassert>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace parley::audio;

void test_partial_push_when_full() {
    RingBuffer<float> buffer(4);
    assert(buffer.capacity() == 4);

    std::vector<float> clip = {0.1f, 0.2f, 0.3f, 0.4f, 0.5f};
    assert(buffer.push(clip.data(), clip.size()) == 4);
    assert(buffer.available() == 4);

    // Caller resumes from the returned offset once the device drains
    std::vector<float> out(2);
    assert(buffer.pop(out.data(), 2) == 2);
    assert(buffer.push(clip.data() + 4, 1) == 1);

    std::vector<float> rest(8);
    assert(buffer.pop(rest.data(), rest.size()) == 3);
    assert(rest[0] == 0.3f && rest[1] == 0.4f && rest[2] == 0.5f);

    std::cout << "[PASS] test_partial_push_when_full" << std::endl;
}

void test_wraparound_keeps_order() {
    RingBuffer<float> buffer(5);
    std::vector<float> out(3);

    for (int round = 0; round < 10; ++round) {
        float base = static_cast<float>(round * 3);
        std::vector<float> in = {base, base + 1, base + 2};
        assert(buffer.push(in.data(), in.size()) == 3);
        assert(buffer.pop(out.data(), out.size()) == 3);
        assert(out == in);
    }

    std::cout << "[PASS] test_wraparound_keeps_order" << std::endl;
}

void test_clear_discards_pending() {
    RingBuffer<float> buffer(16);
    std::vector<float> clip(10, 0.25f);
    buffer.push(clip.data(), clip.size());

    buffer.clear();
    assert(buffer.available() == 0);

    float sample = 0.0f;
    assert(buffer.pop(&sample, 1) == 0);

    std::cout << "[PASS] test_clear_discards_pending" << std::endl;
}

void test_concurrent_stream() {
    RingBuffer<float> buffer(256);
    constexpr size_t total = 20000;
    std::atomic<bool> done{false};
    bool in_order = true;
    size_t received = 0;

    std::thread producer([&]() {
        size_t sent = 0;
        std::vector<float> chunk(64);
        while (sent < total) {
            size_t n = std::min(chunk.size(), total - sent);
            for (size_t i = 0; i < n; ++i) chunk[i] = static_cast<float>(sent + i);
            size_t offset = 0;
            while (offset < n) {
                offset += buffer.push(chunk.data() + offset, n - offset);
                if (offset < n) std::this_thread::sleep_for(std::chrono::microseconds(50));
            }
            sent += n;
        }
        done = true;
    });

    std::thread consumer([&]() {
        std::vector<float> chunk(48);
        while (!done || buffer.available() > 0) {
            size_t n = buffer.pop(chunk.data(), chunk.size());
            for (size_t i = 0; i < n; ++i) {
                if (chunk[i] != static_cast<float>(received + i)) in_order = false;
            }
            received += n;
            if (n == 0) std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    });

    producer.join();
    consumer.join();

    assert(received == total);
    assert(in_order);

    std::cout << "[PASS] test_concurrent_stream (samples=" << received << ")" << std::endl;
}

int main() {
    std::cout << "=== RingBuffer Tests ===" << std::endl;

    test_partial_push_when_full();
    test_wraparound_keeps_order();
    test_clear_discards_pending();
    test_concurrent_stream();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
