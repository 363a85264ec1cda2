#pragma once

#include <cstdint>


namespace lcr {

// -----------------------------------------------------------------------------
// Power-of-two predicate (zero is not a power of two)
[[nodiscard]] constexpr bool is_power_of_two(std::uint64_t n) noexcept {
    return n != 0 && (n & (n - 1)) == 0;
}

// -----------------------------------------------------------------------------
// Branchless round up to next power of two for 64-bit
[[nodiscard]] inline std::uint64_t round_up_to_power_of_two_64(std::uint64_t n) noexcept {
    if (n <= 1) return 1;
    --n;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return ++n;
}

} // namespace lcr
