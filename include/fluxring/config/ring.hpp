/*
================================================================================
Ring Buffer Configuration
================================================================================

Compile-time defaults for ring buffers, barriers and wait strategies.

Capacity:
    Must be a power of two so `sequence & (capacity - 1)` maps a sequence to
    its slot. A runtime profile may override DEFAULT_CAPACITY.

Gating table:
    Every consumer registers one gating sequence. The table is fixed-size so the
    producer never allocates or locks while scanning for the slowest consumer.

Parking wait strategy:
    PARK_SPIN_LIMIT   iterations of CPU relax hints
    PARK_YIELD_LIMIT  iterations (cumulative) before switching to sleep
    PARK_SLEEP        bounded sleep per iteration once parked

The parking values favour sub-microsecond wakeup while keeping waiting threads
schedulable. Busy-spin and yielding strategies ignore them.

Busy-spin producer:
    BUSY_PARK_SPINS   relax hints per backoff step while the ring is full
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>


namespace fluxring::config::ring {

inline constexpr std::size_t DEFAULT_CAPACITY     = 1024;
inline constexpr std::size_t MAX_GATING_SEQUENCES = 16;

inline constexpr std::size_t PARK_SPIN_LIMIT  = 100;
inline constexpr std::size_t PARK_YIELD_LIMIT = 200;
inline constexpr std::chrono::nanoseconds PARK_SLEEP = std::chrono::microseconds(1);

inline constexpr std::uint32_t BUSY_PARK_SPINS = 16;

// Parking interval used by demand waits (await_demand_or_terminal)
inline constexpr std::chrono::nanoseconds DEMAND_PARK = std::chrono::nanoseconds(1);

static_assert(PARK_YIELD_LIMIT >= PARK_SPIN_LIMIT, "yield stage must follow spin stage");

} // namespace fluxring::config::ring
