#pragma once

#include <thread>
#include <chrono>
#include <cstddef>
#include <utility>

#include "lcr/system/cpu_relax.hpp"

namespace lcr {

/**
 * Adaptive backoff loop.
 *
 * Template parameters:
 *   Op:  () -> bool       operation attempted repeatedly until success
 *   Stop: () -> bool      external stop predicate (e.g., alert flag)
 *
 * Stages:
 *   1. [0, spin1)      pure CPU relax hint
 *   2. [spin1, spin2)  scheduler yield
 *   3. [spin2, ...)    bounded sleep of `sleep_time` per iteration
 *
 * Returns:
 *   true  → operation succeeded
 *   false → stop condition activated before success
 */
template <typename Op, typename Stop>
inline bool adaptive_backoff_until(
    Op&& op,
    Stop&& stop,
    std::size_t spin1 = 100,
    std::size_t spin2 = 200,
    std::chrono::nanoseconds sleep_time = std::chrono::microseconds(1)
)
{
    std::size_t spins = 0;

    while (true) {
        // 1. Try the operation
        if (op()) [[likely]]
            return true;
        // 2. Stop condition
        if (stop()) [[unlikely]]
            return false;
        // 3. Adaptive backoff
        if (spins < spin1) {
            system::cpu_relax();
        }
        else if (spins < spin2) {
            std::this_thread::yield();
        }
        else {
            std::this_thread::sleep_for(sleep_time);
        }

        ++spins;
    }
}

} // namespace lcr
