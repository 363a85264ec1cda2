#pragma once

#include <cstdint>
#include <limits>

#include "lcr/sequence.hpp"


namespace fluxring::stream {

// Sentinel for "unbounded" demand. Saturating: never wraps past it.
inline constexpr std::int64_t UNBOUNDED = std::numeric_limits<std::int64_t>::max();

// -----------------------------------------------------------------------------
// Saturating addition of two non-negative demand amounts
// -----------------------------------------------------------------------------
[[nodiscard]] constexpr std::int64_t add_cap(std::int64_t a, std::int64_t b) noexcept {
    if (a == UNBOUNDED || b == UNBOUNDED) return UNBOUNDED;
    if (a > UNBOUNDED - b) return UNBOUNDED;
    return a + b;
}

// Saturating multiplication of two non-negative amounts
[[nodiscard]] constexpr std::int64_t multiply_cap(std::int64_t a, std::int64_t b) noexcept {
    if (a == 0 || b == 0) return 0;
    if (a == UNBOUNDED || b == UNBOUNDED) return UNBOUNDED;
    if (a > UNBOUNDED / b) return UNBOUNDED;
    return a * b;
}

// -----------------------------------------------------------------------------
// Atomically add `n` to a pending-demand counter, clamping at UNBOUNDED.
// Returns the new value.
// -----------------------------------------------------------------------------
inline std::int64_t add_demand(lcr::sequence& pending, std::int64_t n) noexcept {
    while (true) {
        const std::int64_t current = pending.get();
        if (current == UNBOUNDED) {
            return UNBOUNDED;
        }
        const std::int64_t next = add_cap(current, n);
        if (pending.compare_and_set(current, next)) {
            return next;
        }
    }
}

// -----------------------------------------------------------------------------
// Consume one unit of demand. UNBOUNDED is never decremented.
// Returns false (and leaves the counter untouched) when nothing is authorised.
// -----------------------------------------------------------------------------
[[nodiscard]] inline bool try_consume_demand(lcr::sequence& pending) noexcept {
    while (true) {
        const std::int64_t current = pending.get();
        if (current == UNBOUNDED) {
            return true;
        }
        if (current <= 0) {
            return false;
        }
        if (pending.compare_and_set(current, current - 1)) {
            return true;
        }
    }
}

} // namespace fluxring::stream
