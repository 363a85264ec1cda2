/*
===============================================================================
 ring::sequence_barrier - Unit Tests
===============================================================================

Every test runs once per wait strategy (busy_spin, yielding, parking).

Covered Requirements:
---------------------
B1. wait_for returns the highest available sequence (batch draining)
B2. wait_for blocks until the producer publishes
B3. alert() wakes a blocked waiter with wait_status::Alerted
    - later waits fail fast until clear_alert()
B4. Dependent sequences cap the available sequence

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

#include "fluxring/ring/ring_buffer.hpp"
#include "common/test_check.hpp"

using namespace fluxring;
using namespace std::chrono_literals;


template <ring::WaitStrategy W>
void test_batch_available(const char* name) {
    std::cout << "[TEST] B1 (" << name << "): highest available sequence\n";

    ring::ring_buffer<std::int64_t, W> ring(8);
    auto barrier = ring.new_barrier();

    ring.publish(0, ring.next(3));   // 0..2

    const ring::wait_result r = barrier->wait_for(0);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.status == ring::wait_status::Available);
    TEST_CHECK(r.available == 2);
    TEST_CHECK(barrier->cursor() == 2);

    std::cout << "[TEST] OK\n";
}

template <ring::WaitStrategy W>
void test_blocks_until_published(const char* name) {
    std::cout << "[TEST] B2 (" << name << "): waits for the producer\n";

    ring::ring_buffer<std::int64_t, W> ring(8);
    auto barrier = ring.new_barrier();

    std::atomic<bool> returned{false};
    ring::wait_result result;

    std::thread consumer([&] {
        result = barrier->wait_for(0);
        returned.store(true);
    });

    std::this_thread::sleep_for(20ms);
    TEST_CHECK(!returned.load());

    const std::int64_t s = ring.next();
    ring.get(s) = 11;
    ring.publish(s);

    consumer.join();
    TEST_CHECK(result.ok());
    TEST_CHECK(result.available == 0);
    TEST_CHECK(ring.get(result.available) == 11);

    std::cout << "[TEST] OK\n";
}

template <ring::WaitStrategy W>
void test_alert(const char* name) {
    std::cout << "[TEST] B3 (" << name << "): alert wakes the waiter\n";

    ring::ring_buffer<std::int64_t, W> ring(8);
    auto barrier = ring.new_barrier();
    TEST_CHECK(!barrier->check_alert());

    ring::wait_result result;
    std::thread consumer([&] {
        result = barrier->wait_for(10);
    });

    std::this_thread::sleep_for(20ms);
    barrier->alert();
    consumer.join();

    TEST_CHECK(!result.ok());
    TEST_CHECK(result.status == ring::wait_status::Alerted);
    TEST_CHECK(barrier->check_alert());
    TEST_CHECK(barrier->is_alerted());

    // Even an already available sequence is refused while alerted
    ring.publish(ring.next());
    TEST_CHECK(barrier->wait_for(0).status == ring::wait_status::Alerted);

    barrier->clear_alert();
    TEST_CHECK(!barrier->check_alert());
    TEST_CHECK(barrier->wait_for(0).ok());

    std::cout << "[TEST] OK\n";
}

template <ring::WaitStrategy W>
void test_dependents(const char* name) {
    std::cout << "[TEST] B4 (" << name << "): dependent sequences\n";

    ring::ring_buffer<std::int64_t, W> ring(8);
    lcr::sequence upstream_stage(0);
    auto barrier = ring.new_barrier({&upstream_stage});

    ring.publish(0, ring.next(4));   // 0..3

    const ring::wait_result r = barrier->wait_for(0);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.available == 0);
    TEST_CHECK(barrier->cursor() == 0);

    upstream_stage.set(2);
    TEST_CHECK(barrier->wait_for(1).available == 2);

    std::cout << "[TEST] OK\n";
}

template <ring::WaitStrategy W>
void run_all(const char* name) {
    test_batch_available<W>(name);
    test_blocks_until_published<W>(name);
    test_alert<W>(name);
    test_dependents<W>(name);
}


int main() {
    run_all<ring::wait::busy_spin>("busy_spin");
    run_all<ring::wait::yielding>("yielding");
    run_all<ring::wait::parking>("parking");

    std::cout << "\n[SEQUENCE BARRIER TESTS PASSED]\n";
    return 0;
}
