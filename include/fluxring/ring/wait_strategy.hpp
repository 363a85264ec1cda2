#pragma once

#include <atomic>
#include <algorithm>
#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>
#include <thread>

#include "lcr/sequence.hpp"
#include "lcr/adaptive_backoff_until.hpp"
#include "lcr/system/cpu_relax.hpp"
#include "fluxring/config/ring.hpp"


namespace fluxring::ring {

// ============================================================================
// Wait outcome
// ============================================================================
//
// Available  `available` holds the highest consumable sequence (>= requested)
// Alerted    the barrier was alerted (cooperative cancellation); `available`
//            is meaningless
// ============================================================================

enum class wait_status : std::uint8_t {
    Available,
    Alerted
};

constexpr std::string_view to_string(wait_status s) noexcept {
    switch (s) {
        case wait_status::Available: return "Available";
        case wait_status::Alerted:   return "Alerted";
    }
    return "Unknown";
}

struct wait_result {
    wait_status status = wait_status::Available;
    std::int64_t available = -1;

    [[nodiscard]] inline bool ok() const noexcept { return status == wait_status::Available; }
};

using dependents_view = std::span<const lcr::sequence* const>;

// Highest sequence published by the cursor AND processed by every dependent
[[nodiscard]] inline std::int64_t available_sequence(const lcr::sequence& cursor, dependents_view dependents) noexcept {
    const std::int64_t published = cursor.get();
    if (dependents.empty()) {
        return published;
    }
    return std::min(published, lcr::minimum_sequence(dependents, published));
}

// ============================================================================
// Wait Strategy Concept
// ============================================================================
//
// wait_for()   consumer side: block until `seq` is available or alerted.
//              Must re-check `alerted` on every iteration.
// park()       producer side: one backoff step while the ring is full.
// signal_all() producer side: wake blocked consumers after a publish.
// ============================================================================

template <typename W>
concept WaitStrategy =
requires(W& w, std::int64_t seq, const lcr::sequence& cursor, dependents_view deps, const std::atomic<bool>& alerted) {
    { w.wait_for(seq, cursor, deps, alerted) } -> std::same_as<wait_result>;
    { w.park() } -> std::same_as<void>;
    { w.signal_all() } noexcept -> std::same_as<void>;
};

namespace wait {

// ------------------------------------------------------------
// busy_spin
// ------------------------------------------------------------
// Lowest latency, burns a core. Only for pinned threads.
struct busy_spin {
    wait_result wait_for(std::int64_t seq, const lcr::sequence& cursor, dependents_view deps, const std::atomic<bool>& alerted) {
        std::int64_t available;
        while ((available = available_sequence(cursor, deps)) < seq) {
            if (alerted.load(std::memory_order_acquire)) {
                return {wait_status::Alerted, available};
            }
            lcr::system::cpu_relax();
        }
        return {wait_status::Available, available};
    }

    void park() { lcr::system::cpu_relax(config::ring::BUSY_PARK_SPINS); }

    void signal_all() noexcept {}
};

// ------------------------------------------------------------
// yielding
// ------------------------------------------------------------
// Short spin, then gives the core away on every miss.
struct yielding {
    static constexpr int SPIN_TRIES = 100;

    wait_result wait_for(std::int64_t seq, const lcr::sequence& cursor, dependents_view deps, const std::atomic<bool>& alerted) {
        int counter = SPIN_TRIES;
        std::int64_t available;
        while ((available = available_sequence(cursor, deps)) < seq) {
            if (alerted.load(std::memory_order_acquire)) {
                return {wait_status::Alerted, available};
            }
            if (counter > 0) {
                --counter;
                lcr::system::cpu_relax();
            } else {
                std::this_thread::yield();
            }
        }
        return {wait_status::Available, available};
    }

    void park() { std::this_thread::yield(); }

    void signal_all() noexcept {}
};

// ------------------------------------------------------------
// parking (default)
// ------------------------------------------------------------
// Spin, yield, then bounded sleeps between checks.
struct parking {
    wait_result wait_for(std::int64_t seq, const lcr::sequence& cursor, dependents_view deps, const std::atomic<bool>& alerted) {
        std::int64_t available = -1;
        const bool reached = lcr::adaptive_backoff_until(
            [&] { return (available = available_sequence(cursor, deps)) >= seq; },
            [&] { return alerted.load(std::memory_order_acquire); },
            config::ring::PARK_SPIN_LIMIT,
            config::ring::PARK_YIELD_LIMIT,
            config::ring::PARK_SLEEP
        );
        return {reached ? wait_status::Available : wait_status::Alerted, available};
    }

    void park() { std::this_thread::sleep_for(config::ring::PARK_SLEEP); }

    void signal_all() noexcept {}
};

} // namespace wait

static_assert(WaitStrategy<wait::busy_spin>);
static_assert(WaitStrategy<wait::yielding>);
static_assert(WaitStrategy<wait::parking>);

} // namespace fluxring::ring
