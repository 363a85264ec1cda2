#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "lcr/sequence.hpp"
#include "lcr/log/logger.hpp"
#include "fluxring/error.hpp"
#include "fluxring/signal.hpp"
#include "fluxring/config/ring.hpp"
#include "fluxring/ring/ring_buffer.hpp"
#include "fluxring/ring/routing.hpp"
#include "fluxring/stream/demand.hpp"
#include "fluxring/stream/reactive.hpp"


namespace fluxring::ring {

// How published signals are shared between downstream subscribers
enum class delivery {
    broadcast,  // every subscriber sees every signal (route)
    exclusive   // single subscriber, payload moved out of the slot (route_once)
};

/*
===============================================================================
 Ring buffer processor
===============================================================================

Subscriber on the upstream side, publisher on the downstream side, one ring
buffer in between.

Upstream:
  on_subscribe   request(capacity)
  on_next        publish_next with eager replenishment (at least 1)
  on_error       publish_error
  on_complete    publish_complete

Downstream (one consumer thread per subscriber):
  - registers its own gating sequence one behind the current cursor (the attach
    point stays readable for terminal replay) and its own barrier
  - before the first request: await_demand_or_terminal (terminal signals are
    delivered without demand)
  - afterwards every Next consumes one unit of demand; with none left the
    consumer parks until request() or cancel()
  - Complete / Error end the consumer

cancel() alerts the consumer's barrier. request(n <= 0) stops the consumer
with ProtocolViolation. shutdown() alerts and joins every consumer; finished
consumers are joined and dropped on the next subscribe().

Subscribers registered after a Next was published start at the next
published sequence (hot). A terminal signal already at the cursor is replayed.
A terminated upstream is released and never cancelled.
===============================================================================
*/

template <typename T, WaitStrategy W = wait::parking>
class processor final
    : public stream::subscriber<T>
    , public stream::publisher<T>
    , public stream::bounded
{
public:
    using ring_type = ring_buffer<signal<T>, W>;

private:
    class consumer final : public stream::subscription, public std::enable_shared_from_this<consumer> {
    public:
        consumer(ring_type& ring, delivery mode, std::shared_ptr<stream::subscriber<T>> s)
            : ring_(ring)
            , mode_(mode)
            , subscriber_(std::move(s))
            , pending_(0)
        {}

        bool attach() {
            const auto id = ring_.add_gating_sequence(sequence_, 1);
            if (!id) {
                return false;
            }
            gating_id_ = *id;
            attached_at_ = sequence_.get() + 1;
            barrier_ = ring_.new_barrier();
            return true;
        }

        // Running from here on, so a consumer is never pruned before its thread starts
        void start() {
            running_.store(true, std::memory_order_release);
            thread_ = std::thread(&consumer::run_, this);
        }

        void stop() {
            if (barrier_) {
                barrier_->alert();
            }
        }

        void join() {
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        [[nodiscard]] bool is_running() const noexcept {
            return running_.load(std::memory_order_acquire);
        }

        // ---------------------------------------------------------------------
        // stream::subscription
        // ---------------------------------------------------------------------

        void request(std::int64_t n) override {
            if (n <= 0) [[unlikely]] {
                violation_.store(n, std::memory_order_release);
                stop();
                return;
            }
            stream::add_demand(pending_, n);
        }

        void cancel() override {
            cancelled_.store(true, std::memory_order_release);
            stop();
        }

    private:
        void run_() {
            FR_DEBUG("[processor] consumer " << gating_id_ << " started at " << sequence_.get());

            try {
                subscriber_->on_subscribe(this->shared_from_this());
                consume_();
            } catch (const std::exception& ex) {
                FR_ERROR("[processor] consumer " << gating_id_ << " failed: " << ex.what());
            }

            ring_.remove_gating_sequence(gating_id_);
            FR_DEBUG("[processor] consumer " << gating_id_ << " stopped at " << sequence_.get());
            subscriber_.reset();
            running_.store(false, std::memory_order_release);
        }

        void consume_() {
            const std::int64_t start = attached_at_;
            if (start >= 0 && ring_.get(start).is_terminal()) {
                route(ring_.get(start), *subscriber_);
                return;
            }

            if (!await_demand_or_terminal([this] { return pending_.get() - 1; }, ring_, *barrier_, *subscriber_)) {
                report_violation_();
                return;
            }

            std::int64_t next = start + 1;
            while (true) {
                const wait_result r = barrier_->wait_for(next);
                if (!r.ok()) {
                    report_violation_();
                    return;
                }

                for (; next <= r.available; ++next) {
                    signal<T>& slot = ring_.get(next);
                    const bool terminal = slot.is_terminal();

                    if (!terminal && !await_demand_()) {
                        report_violation_();
                        return;
                    }

                    if (mode_ == delivery::exclusive) {
                        route_once(slot, *subscriber_);
                    } else {
                        route(slot, *subscriber_);
                    }
                    sequence_.set(next);

                    if (terminal) {
                        return;
                    }
                }
            }
        }

        // Parks until one unit of demand is consumed; false when alerted
        bool await_demand_() {
            while (!stream::try_consume_demand(pending_)) {
                if (barrier_->check_alert()) {
                    return false;
                }
                std::this_thread::sleep_for(config::ring::DEMAND_PARK);
            }
            return true;
        }

        // Cancellation is silent; a bad request(n) is reported once
        void report_violation_() {
            const std::int64_t n = violation_.load(std::memory_order_acquire);
            if (n > 0 || cancelled_.load(std::memory_order_acquire)) {
                return;
            }
            FR_WARN("[processor] consumer " << gating_id_ << " received request(" << n << ")");
            subscriber_->on_error(error{error_code::ProtocolViolation,
                                        "request(n) requires n > 0, got " + std::to_string(n)});
        }

    private:
        ring_type& ring_;
        const delivery mode_;
        std::shared_ptr<stream::subscriber<T>> subscriber_;

        lcr::sequence sequence_;
        lcr::sequence pending_;
        std::size_t gating_id_ = 0;
        std::int64_t attached_at_ = lcr::sequence::INITIAL_VALUE;
        std::unique_ptr<sequence_barrier<W>> barrier_;

        std::atomic<std::int64_t> violation_{1};
        std::atomic<bool> cancelled_{false};
        std::atomic<bool> running_{false};
        std::thread thread_;
    };

public:
    explicit processor(std::size_t capacity = config::ring::DEFAULT_CAPACITY,
                       delivery mode = delivery::broadcast,
                       W wait = W{})
        : ring_(capacity, std::move(wait))
        , mode_(mode)
    {}

    ~processor() override {
        shutdown();
    }

    processor(const processor&) = delete;
    processor& operator=(const processor&) = delete;

    // -------------------------------------------------------------------------
    // Upstream side (stream::subscriber<T>)
    // -------------------------------------------------------------------------

    void on_subscribe(std::shared_ptr<stream::subscription> s) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (upstream_ || terminated_) {
                s->cancel();
                return;
            }
            upstream_ = s;
        }
        s->request(static_cast<std::int64_t>(ring_.capacity()));
    }

    // A full ring still asks upstream for one more value: the following claim
    // parks until the slowest consumer frees a slot.
    void on_next(const T& value) override {
        stream::subscription* upstream = upstream_.get();
        publish_next(value, ring_, upstream);
        if (upstream != nullptr && ring_.cached_remaining_capacity() <= 0) {
            upstream->request(1);
        }
    }

    void on_error(const error& cause) override {
        publish_error<T>(cause, ring_);
        release_upstream_();
    }

    void on_complete() override {
        publish_complete<T>(ring_);
        release_upstream_();
    }

    // -------------------------------------------------------------------------
    // Downstream side (stream::publisher<T>)
    // -------------------------------------------------------------------------

    void subscribe(std::shared_ptr<stream::subscriber<T>> s) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shut_down_) {
            s->on_error(error{error_code::ProtocolViolation, "processor is shut down"});
            return;
        }
        prune_finished_();
        if (mode_ == delivery::exclusive && !consumers_.empty()) {
            s->on_error(error{error_code::ProtocolViolation, "exclusive processor accepts a single subscriber"});
            return;
        }

        auto c = std::make_shared<consumer>(ring_, mode_, std::move(s));
        if (!c->attach()) {
            FR_ERROR("[processor] gating table full (" << config::ring::MAX_GATING_SEQUENCES << " consumers)");
            throw exception(error_code::CapacityExceeded, "no free gating sequence for a new subscriber");
        }
        c->start();
        consumers_.push_back(std::move(c));
    }

    // Alert every consumer and join their threads
    void shutdown() {
        std::vector<std::shared_ptr<consumer>> consumers;
        std::shared_ptr<stream::subscription> upstream;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) {
                return;
            }
            shut_down_ = true;
            consumers.swap(consumers_);
            upstream = upstream_;
        }
        if (upstream) {
            upstream->cancel();
        }
        for (auto& c : consumers) {
            c->stop();
        }
        for (auto& c : consumers) {
            c->join();
        }
    }

    // Consumers whose thread has not finished yet
    [[nodiscard]] std::size_t active_consumers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& c : consumers_) {
            if (c->is_running()) ++n;
        }
        return n;
    }

    // -------------------------------------------------------------------------
    // stream::bounded
    // -------------------------------------------------------------------------

    [[nodiscard]] bool is_exposed_to_overflow(const stream::bounded* upstream) const noexcept override {
        return upstream != nullptr && upstream->capacity() > capacity();
    }

    [[nodiscard]] std::int64_t capacity() const noexcept override {
        return static_cast<std::int64_t>(ring_.capacity());
    }

    [[nodiscard]] ring_type& ring() noexcept { return ring_; }

private:
    // The upstream slot stays occupied so a second upstream is still refused
    void release_upstream_() {
        std::shared_ptr<stream::subscription> finished;
        std::lock_guard<std::mutex> lock(mutex_);
        finished.swap(upstream_);
        terminated_ = true;
    }

    // Caller holds mutex_
    void prune_finished_() {
        std::erase_if(consumers_, [](const std::shared_ptr<consumer>& c) {
            if (c->is_running()) {
                return false;
            }
            c->join();
            return true;
        });
    }

    ring_type ring_;
    const delivery mode_;

    mutable std::mutex mutex_;
    std::shared_ptr<stream::subscription> upstream_;
    std::vector<std::shared_ptr<consumer>> consumers_;
    bool terminated_ = false;
    bool shut_down_ = false;
};

} // namespace fluxring::ring
