/**
 * CancellationSignal.hpp - One-shot cancellation flag for a single interaction
 */

#pragma once

#include <atomic>

namespace parley::core {

/**
 * Transitions false -> true at most once. fire() may race from any thread;
 * exactly one caller observes the transition. Create one per interaction and
 * let it die with the interaction, never reuse it.
 */
class CancellationSignal {
public:
    CancellationSignal() = default;

    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    /// @return true only for the call that set the flag
    bool fire() noexcept {
        bool expected = false;
        return fired_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    bool isSet() const noexcept {
        return fired_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> fired_{false};
};

} // namespace parley::core
