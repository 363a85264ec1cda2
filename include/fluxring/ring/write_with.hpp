#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>

#include "lcr/sequence.hpp"
#include "lcr/log/logger.hpp"
#include "fluxring/error.hpp"
#include "fluxring/signal.hpp"
#include "fluxring/ring/ring_buffer.hpp"
#include "fluxring/ring/routing.hpp"
#include "fluxring/stream/reactive.hpp"


namespace fluxring::ring {

/*
===============================================================================
 Demand-driven publish bridge
===============================================================================

write_with(source, ring) adapts a demand-signalling publisher into a ring
buffer. The returned publisher<std::monostate> only reports completion or
failure of the transfer.

Protocol:
  on_subscribe   claim `capacity` sequences, request `capacity` upstream
  on_next        pending -= 1 and fill slot (claimed_hi - pending)
                 pending == 0  -> publish the whole claimed range, claim and
                                  request another `capacity`
                 pending < 0   -> CapacityExceeded: cancel upstream, report
                                  downstream, stop
  on_complete    publish the filled prefix of the current range, complete
  on_error       forward immediately, nothing is published

capacity = min(source capacity, ring capacity) when the source is
stream::bounded, otherwise the ring capacity.

Claimed sequences that will never be filled (early completion, error,
overflow, downstream cancel) are handed back to the ring producer with
reset_claim(), so a later producer on the same ring continues right after the
last published sequence. Values of a range that was never completed are
dropped on cancel.

Claim state is guarded by a recursive mutex: a synchronous source delivers
on_next from inside request(), and cancel() may arrive from any thread.
===============================================================================
*/

template <typename T, WaitStrategy W>
class write_with_subscriber final
    : public stream::subscriber<T>
    , public stream::bounded
    , public std::enable_shared_from_this<write_with_subscriber<T, W>>
{
    // Handle given to the downstream observer: cancel() stops the transfer
    class control final : public stream::subscription {
    public:
        explicit control(std::weak_ptr<write_with_subscriber> owner) : owner_(std::move(owner)) {}

        void request(std::int64_t) override {}

        void cancel() override {
            if (auto owner = owner_.lock()) {
                owner->cancel_();
            }
        }

    private:
        std::weak_ptr<write_with_subscriber> owner_;
    };

public:
    write_with_subscriber(std::shared_ptr<stream::subscriber<std::monostate>> downstream,
                          ring_buffer<signal<T>, W>& ring,
                          std::int64_t capacity)
        : downstream_(std::move(downstream))
        , ring_(ring)
        , capacity_(capacity)
        , pending_(0)
    {}

    void start() {
        downstream_->on_subscribe(std::make_shared<control>(this->weak_from_this()));
    }

    // -------------------------------------------------------------------------
    // stream::subscriber<T>
    // -------------------------------------------------------------------------

    void on_subscribe(std::shared_ptr<stream::subscription> s) override {
        {
            std::lock_guard<std::mutex> lock(upstream_mutex_);
            if (cancelled_.load(std::memory_order_acquire)) {
                s->cancel();
                return;
            }
            upstream_ = s;
        }
        std::lock_guard<std::recursive_mutex> lock(claim_mutex_);
        request_(capacity_);
    }

    void on_next(const T& value) override {
        std::lock_guard<std::recursive_mutex> lock(claim_mutex_);
        if (stopped_()) [[unlikely]] {
            return;
        }
        const std::int64_t remaining = pending_.add_and_get(-1);
        if (remaining < 0) [[unlikely]] {
            fail_capacity_exceeded_();
            return;
        }

        detail::populate_next(ring_.get(claimed_hi_ - remaining), value);

        if (remaining == 0) {
            ring_.publish(claimed_hi_ - capacity_ + 1, claimed_hi_);
            claimed_ = false;
            request_(capacity_);
        }
    }

    void on_error(const error& cause) override {
        {
            std::lock_guard<std::recursive_mutex> lock(claim_mutex_);
            if (stopped_()) {
                return;
            }
            done_ = true;
            release_claim_();
        }
        downstream_->on_error(cause);
    }

    void on_complete() override {
        {
            std::lock_guard<std::recursive_mutex> lock(claim_mutex_);
            if (stopped_()) {
                return;
            }
            done_ = true;
            if (claimed_) {
                const std::int64_t lo = claimed_hi_ - capacity_ + 1;
                const std::int64_t hi = claimed_hi_ - pending_.get();
                ring_.publish(lo, hi);
                ring_.reset_claim(hi);
                claimed_ = false;
            }
        }
        FR_DEBUG("[write_with] upstream complete, cursor=" << ring_.cursor());
        downstream_->on_complete();
    }

    // -------------------------------------------------------------------------
    // stream::bounded
    // -------------------------------------------------------------------------

    [[nodiscard]] bool is_exposed_to_overflow(const stream::bounded*) const noexcept override {
        return false;
    }

    [[nodiscard]] std::int64_t capacity() const noexcept override {
        return capacity_;
    }

private:
    void request_(std::int64_t n) {
        std::shared_ptr<stream::subscription> upstream = current_upstream_();
        if (!upstream || done_) {
            return;
        }
        pending_.add_and_get(n);
        claimed_hi_ = ring_.next(n);
        claimed_ = true;
        upstream->request(n);
    }

    // Caller holds claim_mutex_
    bool stopped_() noexcept {
        if (!done_ && cancelled_.load(std::memory_order_acquire)) {
            done_ = true;
            release_claim_();
        }
        return done_;
    }

    // Unfilled claims go back to the producer, nothing becomes visible
    void release_claim_() noexcept {
        if (claimed_) {
            ring_.reset_claim(claimed_hi_ - capacity_);
            claimed_ = false;
        }
    }

    void fail_capacity_exceeded_() {
        done_ = true;
        release_claim_();
        if (auto upstream = current_upstream_()) {
            upstream->cancel();
        }
        FR_ERROR("[write_with] upstream delivered more values than requested (capacity=" << capacity_ << ")");
        downstream_->on_error(error{error_code::CapacityExceeded,
                                    "upstream exceeded requested capacity of " + std::to_string(capacity_)});
    }

    void cancel_() {
        cancelled_.store(true, std::memory_order_release);
        {
            std::lock_guard<std::recursive_mutex> lock(claim_mutex_);
            stopped_();
        }
        std::shared_ptr<stream::subscription> upstream;
        {
            std::lock_guard<std::mutex> lock(upstream_mutex_);
            upstream = std::move(upstream_);
        }
        if (upstream) {
            upstream->cancel();
        }
    }

    std::shared_ptr<stream::subscription> current_upstream_() {
        std::lock_guard<std::mutex> lock(upstream_mutex_);
        return upstream_;
    }

private:
    std::shared_ptr<stream::subscriber<std::monostate>> downstream_;
    ring_buffer<signal<T>, W>& ring_;
    const std::int64_t capacity_;

    lcr::sequence pending_;
    std::int64_t claimed_hi_ = lcr::sequence::INITIAL_VALUE;
    bool claimed_ = false;
    bool done_ = false;
    std::recursive_mutex claim_mutex_;

    std::mutex upstream_mutex_;
    std::shared_ptr<stream::subscription> upstream_;
    std::atomic<bool> cancelled_{false};
};


template <typename T, WaitStrategy W>
class write_with_publisher final : public stream::publisher<std::monostate> {
public:
    write_with_publisher(std::shared_ptr<stream::publisher<T>> source, ring_buffer<signal<T>, W>& ring, std::int64_t capacity)
        : source_(std::move(source))
        , ring_(ring)
        , capacity_(capacity)
    {}

    void subscribe(std::shared_ptr<stream::subscriber<std::monostate>> s) override {
        auto bridge = std::make_shared<write_with_subscriber<T, W>>(std::move(s), ring_, capacity_);
        bridge->start();
        source_->subscribe(bridge);
    }

    [[nodiscard]] std::int64_t capacity() const noexcept { return capacity_; }

private:
    std::shared_ptr<stream::publisher<T>> source_;
    ring_buffer<signal<T>, W>& ring_;
    const std::int64_t capacity_;
};


template <typename T, WaitStrategy W>
[[nodiscard]] std::shared_ptr<write_with_publisher<T, W>>
write_with(std::shared_ptr<stream::publisher<T>> source, ring_buffer<signal<T>, W>& ring) {
    std::int64_t capacity = static_cast<std::int64_t>(ring.capacity());
    if (const auto* b = dynamic_cast<const stream::bounded*>(source.get())) {
        capacity = std::clamp<std::int64_t>(b->capacity(), 1, capacity);
    }
    return std::make_shared<write_with_publisher<T, W>>(std::move(source), ring, capacity);
}

} // namespace fluxring::ring
