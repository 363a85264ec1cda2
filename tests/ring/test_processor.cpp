/*
===============================================================================
 ring::processor - Unit Tests
===============================================================================

Scope:
------
Upstream signals written into the ring, delivered by one consumer thread per
downstream subscriber under that subscriber's demand.

Covered Requirements:
---------------------
P1. Demand is honoured
    - values beyond the requested amount wait for request()
P2. Terminal signals need no demand
P3. Broadcast
    - every subscriber sees every signal, the producer parks on a full ring
P4. cancel() ends the consumer silently
P5. request(n <= 0) yields one ProtocolViolation
P6. Exclusive delivery
    - a second subscriber is refused, payloads are moved out of the ring
P7. Lifecycle
    - subscribe after shutdown() is refused
    - overflow exposure against a bounded upstream
    - a terminated upstream is not cancelled by shutdown()
P8. A value published before the subscriber requests is delivered once demand
    arrives
P9. An exclusive processor accepts a new subscriber once the previous
    consumer has finished

===============================================================================
*/

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fluxring/ring/processor.hpp"
#include "common/test_check.hpp"
#include "common/test_sources.hpp"

using namespace fluxring;
using namespace std::chrono_literals;

using test::BoundedPublisher;
using test::RecordingSubscriber;
using test::ScriptedPublisher;
using test::SignalScript;


template <typename T>
std::shared_ptr<ScriptedPublisher<T>> make_source(SignalScript<T> script) {
    return std::make_shared<ScriptedPublisher<T>>(std::vector<SignalScript<T>>{std::move(script)});
}

// Polls until every consumer thread of `p` has finished
template <typename P>
bool wait_idle(P& p, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (p.active_consumers() != 0) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}


// -----------------------------------------------------------------------------
// P1
// -----------------------------------------------------------------------------
void test_demand_is_honoured() {
    std::cout << "[TEST] P1: demand is honoured\n";

    auto hub = std::make_shared<ring::processor<int>>(8);
    auto sub = std::make_shared<RecordingSubscriber<int>>(2);
    hub->subscribe(sub);

    auto source = make_source(SignalScript<int>{}.values({1, 2, 3, 4, 5}).complete());
    source->subscribe(hub);

    TEST_CHECK(!source->requested().empty());
    TEST_CHECK(source->requested().front() == 8);
    TEST_CHECK(hub->ring().cursor() == 5);

    TEST_CHECK(sub->wait_for_values(2));
    std::this_thread::sleep_for(30ms);
    TEST_CHECK(sub->values().size() == 2);
    TEST_CHECK(sub->completes() == 0);

    sub->request(10);
    TEST_CHECK(sub->wait_for_terminal());
    TEST_CHECK((sub->values() == std::vector<int>{1, 2, 3, 4, 5}));
    TEST_CHECK(sub->completes() == 1);
    TEST_CHECK(sub->errors().empty());

    TEST_CHECK(wait_idle(*hub));
    hub->shutdown();
    TEST_CHECK(source->cancellations() == 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P2
// -----------------------------------------------------------------------------
void test_terminal_without_demand() {
    std::cout << "[TEST] P2: terminal signals need no demand\n";

    {
        auto hub = std::make_shared<ring::processor<int>>(8);
        auto sub = std::make_shared<RecordingSubscriber<int>>();
        hub->subscribe(sub);

        make_source(SignalScript<int>{}.complete())->subscribe(hub);

        TEST_CHECK(sub->wait_for_terminal());
        TEST_CHECK(sub->completes() == 1);
        TEST_CHECK(sub->values().empty());
        hub->shutdown();
    }
    {
        auto hub = std::make_shared<ring::processor<int>>(8);
        auto sub = std::make_shared<RecordingSubscriber<int>>();
        hub->subscribe(sub);

        make_source(SignalScript<int>{}.fail("no data"))->subscribe(hub);

        TEST_CHECK(sub->wait_for_terminal());
        TEST_CHECK(sub->errors().size() == 1);
        TEST_CHECK(sub->errors().front().code == error_code::Upstream);
        TEST_CHECK(sub->errors().front().message == "no data");
        hub->shutdown();
    }
    {
        // Subscribing after completion replays the terminal signal
        auto hub = std::make_shared<ring::processor<int>>(8);
        make_source(SignalScript<int>{}.complete())->subscribe(hub);

        auto late = std::make_shared<RecordingSubscriber<int>>();
        hub->subscribe(late);
        TEST_CHECK(late->wait_for_terminal());
        TEST_CHECK(late->completes() == 1);
        hub->shutdown();
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P3
// -----------------------------------------------------------------------------
void test_broadcast() {
    std::cout << "[TEST] P3: broadcast to every subscriber\n";

    auto hub = std::make_shared<ring::processor<int, ring::wait::yielding>>(8);
    auto a = std::make_shared<RecordingSubscriber<int>>(100);
    auto b = std::make_shared<RecordingSubscriber<int>>(1, 1);
    hub->subscribe(a);
    hub->subscribe(b);

    SignalScript<int> script;
    std::vector<int> expected;
    for (int i = 0; i < 40; ++i) {
        script.value(i);
        expected.push_back(i);
    }
    script.complete();

    // 40 values through 8 slots: the producer parks until both consumers advance
    make_source(script)->subscribe(hub);

    TEST_CHECK(a->wait_for_terminal());
    TEST_CHECK(b->wait_for_terminal());
    TEST_CHECK(a->values() == expected);
    TEST_CHECK(b->values() == expected);
    TEST_CHECK(a->completes() == 1);
    TEST_CHECK(b->completes() == 1);

    TEST_CHECK(wait_idle(*hub));
    hub->shutdown();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P4
// -----------------------------------------------------------------------------
void test_cancel() {
    std::cout << "[TEST] P4: cancel ends the consumer silently\n";

    auto hub = std::make_shared<ring::processor<int>>(8);
    auto sub = std::make_shared<RecordingSubscriber<int>>();
    hub->subscribe(sub);

    while (sub->subscribes() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    sub->cancel();
    TEST_CHECK(wait_idle(*hub));
    TEST_CHECK(sub->errors().empty());
    TEST_CHECK(sub->completes() == 0);

    // The freed gating slot no longer holds the producer back
    auto source = make_source(SignalScript<int>{}.values({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
    source->subscribe(hub);
    TEST_CHECK(source->emitted() == 10);
    TEST_CHECK(sub->values().empty());

    hub->shutdown();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P5
// -----------------------------------------------------------------------------
void test_invalid_request() {
    std::cout << "[TEST] P5: request(0) is a protocol violation\n";

    auto hub = std::make_shared<ring::processor<int>>(8);
    auto sub = std::make_shared<RecordingSubscriber<int>>();
    hub->subscribe(sub);

    while (sub->subscribes() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    sub->request(0);

    TEST_CHECK(sub->wait_for_terminal());
    TEST_CHECK(wait_idle(*hub));
    TEST_CHECK(sub->errors().size() == 1);
    TEST_CHECK(sub->errors().front().code == error_code::ProtocolViolation);

    hub->shutdown();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P6
// -----------------------------------------------------------------------------
void test_exclusive() {
    std::cout << "[TEST] P6: exclusive delivery\n";

    auto hub = std::make_shared<ring::processor<std::string>>(8, ring::delivery::exclusive);
    auto first = std::make_shared<RecordingSubscriber<std::string>>(10);
    auto second = std::make_shared<RecordingSubscriber<std::string>>(10);

    hub->subscribe(first);
    hub->subscribe(second);

    TEST_CHECK(second->errors().size() == 1);
    TEST_CHECK(second->errors().front().code == error_code::ProtocolViolation);

    make_source(SignalScript<std::string>{}.values({"alpha", "beta"}).complete())->subscribe(hub);

    TEST_CHECK(first->wait_for_terminal());
    TEST_CHECK((first->values() == std::vector<std::string>{"alpha", "beta"}));
    TEST_CHECK(first->completes() == 1);
    TEST_CHECK(wait_idle(*hub));

    // Payloads were moved out of their slots
    TEST_CHECK(!hub->ring().get(0).value.has_value());
    TEST_CHECK(!hub->ring().get(1).value.has_value());

    hub->shutdown();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P7
// -----------------------------------------------------------------------------
void test_lifecycle() {
    std::cout << "[TEST] P7: shutdown and overflow exposure\n";

    auto hub = std::make_shared<ring::processor<int>>(8);
    TEST_CHECK(hub->capacity() == 8);

    BoundedPublisher<int> wide(16, {SignalScript<int>{}.complete()});
    BoundedPublisher<int> narrow(4, {SignalScript<int>{}.complete()});
    TEST_CHECK(hub->is_exposed_to_overflow(&wide));
    TEST_CHECK(!hub->is_exposed_to_overflow(&narrow));
    TEST_CHECK(!hub->is_exposed_to_overflow(nullptr));

    auto sub = std::make_shared<RecordingSubscriber<int>>(1);
    hub->subscribe(sub);
    hub->shutdown();
    TEST_CHECK(hub->active_consumers() == 0);
    TEST_CHECK(sub->errors().empty());

    // Idempotent
    hub->shutdown();

    auto late = std::make_shared<RecordingSubscriber<int>>(1);
    hub->subscribe(late);
    TEST_CHECK(late->errors().size() == 1);
    TEST_CHECK(late->errors().front().code == error_code::ProtocolViolation);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P8
// -----------------------------------------------------------------------------
void test_value_before_demand() {
    std::cout << "[TEST] P8: value published before demand\n";

    auto hub = std::make_shared<ring::processor<int>>(8);
    auto sub = std::make_shared<RecordingSubscriber<int>>();
    hub->subscribe(sub);

    auto source = make_source(SignalScript<int>{}.value(42));
    source->subscribe(hub);
    TEST_CHECK(hub->ring().cursor() == 0);

    while (sub->subscribes() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    std::this_thread::sleep_for(50ms);
    TEST_CHECK(sub->values().empty());

    sub->request(1);
    TEST_CHECK(sub->wait_for_values(1));
    TEST_CHECK((sub->values() == std::vector<int>{42}));
    TEST_CHECK(sub->completes() == 0);

    // Upstream still live: shutdown cancels it
    hub->shutdown();
    TEST_CHECK(source->cancellations() == 1);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P9
// -----------------------------------------------------------------------------
void test_exclusive_resubscribe() {
    std::cout << "[TEST] P9: exclusive slot freed by a finished consumer\n";

    auto hub = std::make_shared<ring::processor<int>>(8, ring::delivery::exclusive);
    auto first = std::make_shared<RecordingSubscriber<int>>(4);
    hub->subscribe(first);

    make_source(SignalScript<int>{}.values({1, 2}).complete())->subscribe(hub);
    TEST_CHECK(first->wait_for_terminal());
    TEST_CHECK(wait_idle(*hub));

    // The terminal signal is replayed to the new consumer
    auto second = std::make_shared<RecordingSubscriber<int>>(4);
    hub->subscribe(second);
    TEST_CHECK(second->wait_for_terminal());
    TEST_CHECK(second->errors().empty());
    TEST_CHECK(second->completes() == 1);
    TEST_CHECK(second->values().empty());

    hub->shutdown();
    std::cout << "[TEST] OK\n";
}


int main() {
    test_demand_is_honoured();
    test_terminal_without_demand();
    test_broadcast();
    test_cancel();
    test_invalid_request();
    test_exclusive();
    test_lifecycle();
    test_value_before_demand();
    test_exclusive_resubscribe();

    std::cout << "\n[PROCESSOR TESTS PASSED]\n";
    return 0;
}
