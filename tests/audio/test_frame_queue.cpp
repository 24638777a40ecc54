/**
 * test_frame_queue.cpp - Bounded capture queue
 */

#include "parley/audio/FrameQueue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace parley;
using namespace parley::audio;

namespace {

AudioFrame tagged(float value) {
    return AudioFrame(4, value);
}

} // anonymous namespace

void test_fifo_order() {
    FrameQueue queue(8);
    queue.push(tagged(1.0f));
    queue.push(tagged(2.0f));

    assert(queue.size() == 2);
    assert(queue.pop(std::chrono::milliseconds(0))->front() == 1.0f);
    assert(queue.pop(std::chrono::milliseconds(0))->front() == 2.0f);
    assert(queue.size() == 0);

    std::cout << "[PASS] test_fifo_order" << std::endl;
}

void test_full_queue_drops_oldest() {
    FrameQueue queue(3);
    for (int i = 1; i <= 5; ++i) {
        queue.push(tagged(static_cast<float>(i)));
    }

    assert(queue.size() == 3);
    assert(queue.dropped() == 2);
    assert(queue.pop(std::chrono::milliseconds(0))->front() == 3.0f);

    std::cout << "[PASS] test_full_queue_drops_oldest" << std::endl;
}

void test_pop_times_out() {
    FrameQueue queue;
    auto start = std::chrono::steady_clock::now();
    auto frame = queue.pop(std::chrono::milliseconds(80));
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!frame);
    assert(elapsed >= std::chrono::milliseconds(75));

    std::cout << "[PASS] test_pop_times_out" << std::endl;
}

void test_pop_wakes_on_push() {
    FrameQueue queue;
    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        queue.push(tagged(7.0f));
    });

    auto start = std::chrono::steady_clock::now();
    auto frame = queue.pop(std::chrono::seconds(2));
    auto elapsed = std::chrono::steady_clock::now() - start;
    producer.join();

    assert(frame && frame->front() == 7.0f);
    assert(elapsed < std::chrono::seconds(1));

    std::cout << "[PASS] test_pop_wakes_on_push" << std::endl;
}

void test_clear() {
    FrameQueue queue(4);
    queue.push(tagged(1.0f));
    queue.push(tagged(2.0f));
    queue.clear();

    assert(queue.size() == 0);
    assert(!queue.pop(std::chrono::milliseconds(0)));

    std::cout << "[PASS] test_clear" << std::endl;
}

int main() {
    std::cout << "=== FrameQueue Tests ===" << std::endl;

    test_fifo_order();
    test_full_queue_drops_oldest();
    test_pop_times_out();
    test_pop_wakes_on_push();
    test_clear();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
