/*
===============================================================================
 ring::ring_buffer - Unit Tests
===============================================================================

Scope:
------
Producer-side claim/publish discipline and consumer gating of
fluxring::ring::ring_buffer<E, W>.

Covered Requirements:
---------------------
R1. Construction
    - Power-of-two capacities are accepted
    - Any other capacity throws InvalidCapacity

R2. Claim / publish
    - next() hands out consecutive sequences
    - get(seq) addresses seq & (capacity - 1)
    - The cursor only moves on publish

R3. Scoped claim
    - claim(n) publishes its whole range when destroyed

R4. Claim size contract
    - next(n) with n < 1 or n > capacity throws ProtocolViolation

R5. No-overwrite invariant
    - Capacity 4, consumer lagging by 3: try_next() fails, next() blocks
      until the consumer advances, the unread slot is never overwritten

R6. Remaining capacity
    - capacity - (cursor - slowest gating sequence)

R7. reset_claim
    - Unpublished claims are handed back to the producer

R8. Gating table
    - Registration positions the consumer at the cursor
    - The table is bounded; released ids are reused

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "fluxring/ring/ring_buffer.hpp"
#include "common/test_check.hpp"

using namespace fluxring;
using namespace std::chrono_literals;


// -----------------------------------------------------------------------------
// R1
// -----------------------------------------------------------------------------
void test_capacity_validation() {
    std::cout << "[TEST] R1: capacity validation\n";

    ring::ring_buffer<std::int64_t> one(1);
    TEST_CHECK(one.capacity() == 1);

    ring::ring_buffer<std::int64_t> big(1024);
    TEST_CHECK(big.capacity() == 1024);

    for (std::size_t bad : {std::size_t{0}, std::size_t{3}, std::size_t{6}, std::size_t{1000}}) {
        bool thrown = false;
        try {
            ring::ring_buffer<std::int64_t> r(bad);
        } catch (const fluxring::exception& e) {
            thrown = true;
            TEST_CHECK(e.code() == error_code::InvalidCapacity);
        }
        TEST_CHECK(thrown);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R2
// -----------------------------------------------------------------------------
void test_claim_and_publish() {
    std::cout << "[TEST] R2: claim and publish\n";

    ring::ring_buffer<std::int64_t> ring(8);
    TEST_CHECK(ring.cursor() == -1);

    const std::int64_t s0 = ring.next();
    TEST_CHECK(s0 == 0);
    ring.get(s0) = 100;

    // Claimed but not yet visible
    TEST_CHECK(ring.cursor() == -1);

    ring.publish(s0);
    TEST_CHECK(ring.cursor() == 0);
    TEST_CHECK(ring.get(0) == 100);

    const std::int64_t hi = ring.next(3);
    TEST_CHECK(hi == 3);
    for (std::int64_t s = 1; s <= hi; ++s) {
        ring.get(s) = 100 + s;
    }
    ring.publish(1, hi);
    TEST_CHECK(ring.cursor() == 3);

    // Slot addressing wraps with the mask
    TEST_CHECK(&ring.get(3) == &ring.get(11));

    // Empty range is a no-op
    ring.publish(5, 4);
    TEST_CHECK(ring.cursor() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R3
// -----------------------------------------------------------------------------
void test_scoped_claim() {
    std::cout << "[TEST] R3: scoped claim publishes on destruction\n";

    ring::ring_buffer<std::int64_t> ring(8);
    {
        auto claim = ring.claim(2);
        TEST_CHECK(claim.first() == 0);
        TEST_CHECK(claim.last() == 1);
        claim[claim.first()] = 7;
        claim[claim.last()] = 8;
        TEST_CHECK(ring.cursor() == -1);
    }
    TEST_CHECK(ring.cursor() == 1);
    TEST_CHECK(ring.get(0) == 7);
    TEST_CHECK(ring.get(1) == 8);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R4
// -----------------------------------------------------------------------------
void test_claim_size_contract() {
    std::cout << "[TEST] R4: claim size contract\n";

    ring::ring_buffer<std::int64_t> ring(4);

    for (std::int64_t bad : {std::int64_t{0}, std::int64_t{-1}, std::int64_t{5}}) {
        bool thrown = false;
        try {
            (void)ring.next(bad);
        } catch (const fluxring::exception& e) {
            thrown = true;
            TEST_CHECK(e.code() == error_code::ProtocolViolation);
        }
        TEST_CHECK(thrown);
    }

    // Nothing was claimed by the failed calls
    TEST_CHECK(ring.next() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R5
// -----------------------------------------------------------------------------
void test_no_overwrite_of_unread_slot() {
    std::cout << "[TEST] R5: producer never overwrites an unread slot\n";

    ring::ring_buffer<std::int64_t> ring(4);
    lcr::sequence consumer;
    const auto id = ring.add_gating_sequence(consumer);
    TEST_CHECK(id.has_value());
    TEST_CHECK(consumer.get() == -1);

    for (std::int64_t i = 0; i < 4; ++i) {
        const std::int64_t s = ring.next();
        ring.get(s) = i;
        ring.publish(s);
    }

    // Ring is full: the consumer has not read sequence 0 yet
    TEST_CHECK(ring.cached_remaining_capacity() == 0);
    TEST_CHECK(!ring.try_next().has_value());

    std::atomic<bool> claimed{false};
    std::atomic<std::int64_t> claimed_seq{-1};

    std::thread producer([&] {
        const std::int64_t s = ring.next();
        claimed_seq.store(s);
        claimed.store(true);
        ring.get(s) = 4;
        ring.publish(s);
    });

    std::this_thread::sleep_for(50ms);
    TEST_CHECK(!claimed.load());
    TEST_CHECK(ring.get(0) == 0);

    // Consumer reads sequence 0, lag drops to 3
    consumer.set(0);
    producer.join();

    TEST_CHECK(claimed.load());
    TEST_CHECK(claimed_seq.load() == 4);
    TEST_CHECK(ring.cursor() == 4);
    TEST_CHECK(ring.get(4) == 4);
    TEST_CHECK(ring.get(1) == 1);

    ring.remove_gating_sequence(*id);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R6
// -----------------------------------------------------------------------------
void test_remaining_capacity() {
    std::cout << "[TEST] R6: cached remaining capacity\n";

    ring::ring_buffer<std::int64_t> ring(8);

    // No consumer: the whole ring is free
    TEST_CHECK(ring.cached_remaining_capacity() == 8);

    lcr::sequence consumer;
    const auto id = ring.add_gating_sequence(consumer);
    TEST_CHECK(id.has_value());

    ring.publish(0, ring.next(5));
    TEST_CHECK(ring.cached_remaining_capacity() == 3);

    consumer.set(2);
    TEST_CHECK(ring.cached_remaining_capacity() == 6);
    TEST_CHECK(ring.minimum_gating_sequence() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R7
// -----------------------------------------------------------------------------
void test_reset_claim() {
    std::cout << "[TEST] R7: reset_claim returns unpublished sequences\n";

    ring::ring_buffer<std::int64_t> ring(8);
    ring.publish(ring.next());
    TEST_CHECK(ring.cursor() == 0);

    (void)ring.next(4);           // claims 1..4
    ring.reset_claim(ring.cursor());

    TEST_CHECK(ring.next() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R8
// -----------------------------------------------------------------------------
void test_gating_table() {
    std::cout << "[TEST] R8: gating table\n";

    ring::ring_buffer<std::int64_t> ring(8);
    ring.publish(0, ring.next(3));

    // Registration positions the consumer at the cursor
    lcr::sequence late;
    const auto late_id = ring.add_gating_sequence(late);
    TEST_CHECK(late_id.has_value());
    TEST_CHECK(late.get() == 2);

    std::vector<std::unique_ptr<lcr::sequence>> sequences;
    std::vector<std::size_t> ids;
    while (true) {
        sequences.push_back(std::make_unique<lcr::sequence>());
        const auto id = ring.add_gating_sequence(*sequences.back());
        if (!id) {
            break;
        }
        ids.push_back(*id);
    }
    TEST_CHECK(ids.size() + 1 == config::ring::MAX_GATING_SEQUENCES);

    ring.remove_gating_sequence(ids.front());
    lcr::sequence again;
    const auto reused = ring.add_gating_sequence(again);
    TEST_CHECK(reused.has_value());
    TEST_CHECK(*reused == ids.front());

    std::cout << "[TEST] OK\n";
}


int main() {
    test_capacity_validation();
    test_claim_and_publish();
    test_scoped_claim();
    test_claim_size_contract();
    test_no_overwrite_of_unread_slot();
    test_remaining_capacity();
    test_reset_claim();
    test_gating_table();

    std::cout << "\n[RING BUFFER TESTS PASSED]\n";
    return 0;
}
