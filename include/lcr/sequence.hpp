#pragma once

#include <atomic>
#include <cstdint>
#include <limits>


namespace lcr {


// -----------------------------------------------------------------------------
// Cache-line padded atomic sequence counter.
//
// Identifies a position in a ring buffer (producer cursor, consumer read
// pointer) or a pending demand count. Only the declared owner mutates it;
// every other thread reads.
//
// Memory ordering:
//   - set() is a release store: everything written before it (slot payload)
//     is visible to any thread that observes the new value through get().
//   - get() is an acquire load.
//   - add_and_get() / compare_and_set() are acq_rel read-modify-writes.
// -----------------------------------------------------------------------------
class alignas(64) sequence {
public:
    static constexpr std::int64_t INITIAL_VALUE = -1;

    explicit sequence(std::int64_t initial = INITIAL_VALUE) noexcept
        : value_(initial) {}

    // Disable copy/move semantics (address identity is the gating contract)
    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;

    [[nodiscard]] inline std::int64_t get() const noexcept {
        return value_.load(std::memory_order_acquire);
    }

    inline void set(std::int64_t v) noexcept {
        value_.store(v, std::memory_order_release);
    }

    // Returns the new value
    inline std::int64_t add_and_get(std::int64_t delta) noexcept {
        return value_.fetch_add(delta, std::memory_order_acq_rel) + delta;
    }

    inline std::int64_t increment_and_get() noexcept {
        return add_and_get(1);
    }

    inline bool compare_and_set(std::int64_t expected, std::int64_t desired) noexcept {
        return value_.compare_exchange_strong(expected, desired,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire);
    }

private:
    std::atomic<std::int64_t> value_;
    char pad_[64 - sizeof(std::atomic<std::int64_t>)]{};
};
// Layout checks
static_assert(sizeof(sequence) == 64, "sequence must be cache-line aligned");
static_assert(alignof(sequence) == 64, "sequence must be cache-line aligned");


// -----------------------------------------------------------------------------
// Lowest value among a set of sequence pointers (null entries are skipped).
// Returns `fallback` when no sequence is present.
// -----------------------------------------------------------------------------
template <typename Range>
[[nodiscard]] inline std::int64_t minimum_sequence(const Range& sequences, std::int64_t fallback) noexcept {
    std::int64_t min = std::numeric_limits<std::int64_t>::max();
    bool found = false;
    for (const sequence* s : sequences) {
        if (s == nullptr) continue;
        const std::int64_t v = s->get();
        if (v < min) min = v;
        found = true;
    }
    return found ? min : fallback;
}

} // namespace lcr
