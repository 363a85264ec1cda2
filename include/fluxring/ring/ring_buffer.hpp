#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lcr/numbers.hpp"
#include "lcr/sequence.hpp"
#include "fluxring/error.hpp"
#include "fluxring/config/ring.hpp"
#include "fluxring/ring/wait_strategy.hpp"
#include "fluxring/ring/sequence_barrier.hpp"


namespace fluxring::ring {

// -----------------------------------------------------------------------------
// Single-producer, multi-consumer sequenced ring buffer.
//
// Overview:
//     - Fixed array of preallocated, mutable slots (power-of-two count)
//     - One logical producer claims sequences with next(), fills get(seq),
//       then makes them visible with publish()
//     - Any number of consumers read the same published range, each tracking
//       its own gating sequence and waiting on a sequence_barrier
//     - The producer never claims `seq` before every gating sequence has
//       passed `seq - capacity` (no overwrite of an unread slot)
//
// Example:
//     ring_buffer<signal<int>> ring(1024);
//     lcr::sequence consumed;
//     auto id = ring.add_gating_sequence(consumed);
//     auto barrier = ring.new_barrier();
//
//     const auto seq = ring.next();        // producer
//     ring.get(seq).value = 42;
//     ring.publish(seq);
//
//     auto r = barrier->wait_for(consumed.get() + 1);   // consumer
//     ...; consumed.set(r.available);
//
// Threading:
//     • next()/try_next()/claim()/reset_claim() belong to ONE producer thread at
//       a time. Fan-in must be serialized before reaching the ring.
//     • get()/cursor()/cached_remaining_capacity() are safe from any thread.
//     • Gating registration is lock-free and may race with the producer.
//
// Failure policy:
//     Claiming without publishing stalls every consumer. Prefer claim(n), which
//     publishes its range when it goes out of scope.
// -----------------------------------------------------------------------------
template <typename E, WaitStrategy W = wait::parking>
class ring_buffer {
public:
    using slot_type     = E;
    using wait_type     = W;
    using barrier_type  = sequence_barrier<W>;

    // -------------------------------------------------------------------------
    // Scoped claim: publishes [lo, hi] on destruction
    // -------------------------------------------------------------------------
    class scoped_claim {
    public:
        scoped_claim(ring_buffer& ring, std::int64_t lo, std::int64_t hi) noexcept
            : ring_(&ring), lo_(lo), hi_(hi) {}

        scoped_claim(scoped_claim&& other) noexcept
            : ring_(std::exchange(other.ring_, nullptr)), lo_(other.lo_), hi_(other.hi_) {}

        scoped_claim(const scoped_claim&) = delete;
        scoped_claim& operator=(const scoped_claim&) = delete;
        scoped_claim& operator=(scoped_claim&&) = delete;

        ~scoped_claim() {
            if (ring_) {
                ring_->publish(lo_, hi_);
            }
        }

        [[nodiscard]] std::int64_t first() const noexcept { return lo_; }
        [[nodiscard]] std::int64_t last() const noexcept { return hi_; }

        [[nodiscard]] E& operator[](std::int64_t seq) noexcept { return ring_->get(seq); }

    private:
        ring_buffer* ring_;
        std::int64_t lo_;
        std::int64_t hi_;
    };

    explicit ring_buffer(std::size_t capacity = config::ring::DEFAULT_CAPACITY, W wait = W{})
        : capacity_(validate_capacity_(capacity))
        , mask_(static_cast<std::int64_t>(capacity) - 1)
        , slots_(std::make_unique<E[]>(capacity))
        , wait_(std::move(wait))
    {
        for (auto& g : gating_) {
            g.store(nullptr, std::memory_order_relaxed);
        }
    }

    // Non-copyable / non-movable (barriers and claims hold references)
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    [[nodiscard]] inline std::size_t capacity() const noexcept { return static_cast<std::size_t>(capacity_); }

    // -------------------------------------------------------------------------
    // Producer side
    // -------------------------------------------------------------------------

    // Claim the next sequence (blocks while the slowest consumer is a full lap behind)
    [[nodiscard]] std::int64_t next() {
        return next(1);
    }

    // Claim the next n sequences; returns the highest claimed sequence
    [[nodiscard]] std::int64_t next(std::int64_t n) {
        check_claim_size_(n);

        const std::int64_t current = next_value_;
        const std::int64_t next_seq = current + n;
        const std::int64_t wrap_point = next_seq - capacity_;
        const std::int64_t cached = cached_gating_;

        if (wrap_point > cached || cached > current) {
            std::int64_t min;
            while (wrap_point > (min = minimum_gating_(current))) {
                wait_.park();
            }
            cached_gating_ = min;
        }

        next_value_ = next_seq;
        return next_seq;
    }

    // Non-blocking claim; std::nullopt when n slots are not free
    [[nodiscard]] std::optional<std::int64_t> try_next(std::int64_t n = 1) {
        check_claim_size_(n);
        if (!has_capacity_(n)) {
            return std::nullopt;
        }
        next_value_ += n;
        return next_value_;
    }

    // Claim n sequences and publish them when the guard is destroyed
    [[nodiscard]] scoped_claim claim(std::int64_t n = 1) {
        const std::int64_t hi = next(n);
        return scoped_claim(*this, hi - n + 1, hi);
    }

    // Return claimed-but-unpublished sequences after `seq` to the producer.
    // `seq` must not be below the published cursor.
    void reset_claim(std::int64_t seq) noexcept {
        next_value_ = seq;
    }

    [[nodiscard]] inline E& get(std::int64_t seq) noexcept {
        return slots_[static_cast<std::size_t>(seq & mask_)];
    }

    [[nodiscard]] inline const E& get(std::int64_t seq) const noexcept {
        return slots_[static_cast<std::size_t>(seq & mask_)];
    }

    inline void publish(std::int64_t seq) noexcept {
        cursor_.set(seq);
        wait_.signal_all();
    }

    // Single producer: advancing the cursor to `hi` publishes the whole range
    inline void publish(std::int64_t lo, std::int64_t hi) noexcept {
        if (hi < lo) {
            return;
        }
        cursor_.set(hi);
        wait_.signal_all();
    }

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    [[nodiscard]] inline std::int64_t cursor() const noexcept {
        return cursor_.get();
    }

    // capacity - (published cursor - slowest gating sequence)
    [[nodiscard]] std::int64_t cached_remaining_capacity() const noexcept {
        const std::int64_t produced = cursor_.get();
        const std::int64_t consumed = minimum_gating_(produced);
        return capacity_ - (produced - consumed);
    }

    // -------------------------------------------------------------------------
    // Consumers
    // -------------------------------------------------------------------------

    // Registers `s` as a gating sequence positioned `lag` sequences behind the
    // current cursor. With lag 1 the slot at the cursor stays protected until
    // the consumer moves past it.
    // Returns the consumer id, or std::nullopt when the gating table is full.
    [[nodiscard]] std::optional<std::size_t> add_gating_sequence(lcr::sequence& s, std::int64_t lag = 0) noexcept {
        for (std::size_t id = 0; id < gating_.size(); ++id) {
            const lcr::sequence* expected = nullptr;
            if (gating_[id].compare_exchange_strong(expected, &s, std::memory_order_acq_rel)) {
                s.set(cursor_.get() - lag);
                return id;
            }
        }
        return std::nullopt;
    }

    void remove_gating_sequence(std::size_t id) noexcept {
        if (id < gating_.size()) {
            gating_[id].store(nullptr, std::memory_order_release);
        }
    }

    [[nodiscard]] std::int64_t minimum_gating_sequence() const noexcept {
        return minimum_gating_(cursor_.get());
    }

    [[nodiscard]] std::unique_ptr<barrier_type> new_barrier(std::vector<const lcr::sequence*> dependents = {}) {
        return std::make_unique<barrier_type>(wait_, cursor_, std::move(dependents));
    }

    [[nodiscard]] inline W& wait_strategy() noexcept { return wait_; }

private:
    static std::int64_t validate_capacity_(std::size_t capacity) {
        if (!lcr::is_power_of_two(capacity)) {
            throw exception(error_code::InvalidCapacity,
                            "ring buffer capacity must be a power of two, got " + std::to_string(capacity));
        }
        return static_cast<std::int64_t>(capacity);
    }

    void check_claim_size_(std::int64_t n) const {
        if (n < 1 || n > capacity_) {
            throw exception(error_code::ProtocolViolation,
                            "claim size must be in [1, " + std::to_string(capacity_) + "], got " + std::to_string(n));
        }
    }

    bool has_capacity_(std::int64_t n) {
        const std::int64_t wrap_point = next_value_ + n - capacity_;
        const std::int64_t cached = cached_gating_;
        if (wrap_point > cached || cached > next_value_) {
            const std::int64_t min = minimum_gating_(next_value_);
            cached_gating_ = min;
            if (wrap_point > min) {
                return false;
            }
        }
        return true;
    }

    std::int64_t minimum_gating_(std::int64_t fallback) const noexcept {
        std::int64_t min = fallback;
        for (const auto& g : gating_) {
            const lcr::sequence* s = g.load(std::memory_order_acquire);
            if (s != nullptr) {
                const std::int64_t v = s->get();
                if (v < min) min = v;
            }
        }
        return min;
    }

private:
    const std::int64_t capacity_;
    const std::int64_t mask_;
    std::unique_ptr<E[]> slots_;
    W wait_;

    alignas(64) lcr::sequence cursor_{lcr::sequence::INITIAL_VALUE};

    // Producer-owned claim state
    alignas(64) std::int64_t next_value_ = lcr::sequence::INITIAL_VALUE;
    std::int64_t cached_gating_ = lcr::sequence::INITIAL_VALUE;

    alignas(64) std::array<std::atomic<const lcr::sequence*>, config::ring::MAX_GATING_SEQUENCES> gating_;
};

} // namespace fluxring::ring
