#pragma once

#include <atomic>
#include <cstdint>
#include <utility>
#include <vector>

#include "lcr/sequence.hpp"
#include "fluxring/ring/wait_strategy.hpp"


namespace fluxring::ring {

// -----------------------------------------------------------------------------
// Sequence Barrier
// -----------------------------------------------------------------------------
//
// Per-consumer view over a ring buffer cursor plus zero or more dependent
// sequences (e.g. an upstream consumer stage that must process a slot first).
//
//   wait_for(seq)  blocks until min(cursor, dependents...) >= seq, or until
//                  alerted. Returns the highest available sequence, which may
//                  be greater than `seq` (batch draining).
//   alert()        cooperative cancellation; wakes and fails current and future
//                  waits until clear_alert().
//
// The barrier holds references to the ring's cursor and wait strategy and must
// not outlive the ring buffer that created it.
// -----------------------------------------------------------------------------
template <WaitStrategy W>
class sequence_barrier {
public:
    sequence_barrier(W& wait, const lcr::sequence& cursor, std::vector<const lcr::sequence*> dependents)
        : wait_(wait)
        , cursor_(cursor)
        , dependents_(std::move(dependents))
    {}

    // Non-copyable / non-movable (waiters hold a reference to alerted_)
    sequence_barrier(const sequence_barrier&) = delete;
    sequence_barrier& operator=(const sequence_barrier&) = delete;

    [[nodiscard]] wait_result wait_for(std::int64_t seq) {
        if (alerted_.load(std::memory_order_acquire)) [[unlikely]] {
            return {wait_status::Alerted, -1};
        }
        return wait_.wait_for(seq, cursor_, dependents_view(dependents_), alerted_);
    }

    // Highest sequence currently safe to read
    [[nodiscard]] std::int64_t cursor() const noexcept {
        return available_sequence(cursor_, dependents_view(dependents_));
    }

    // Non-blocking check for custom spin loops; true when alerted
    [[nodiscard]] bool check_alert() const noexcept {
        return alerted_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_alerted() const noexcept {
        return check_alert();
    }

    void alert() noexcept {
        alerted_.store(true, std::memory_order_release);
        wait_.signal_all();
    }

    void clear_alert() noexcept {
        alerted_.store(false, std::memory_order_release);
    }

private:
    W& wait_;
    const lcr::sequence& cursor_;
    const std::vector<const lcr::sequence*> dependents_;
    std::atomic<bool> alerted_{false};
};

} // namespace fluxring::ring
