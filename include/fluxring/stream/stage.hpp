#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "lcr/sequence.hpp"
#include "lcr/log/logger.hpp"
#include "fluxring/error.hpp"
#include "fluxring/stream/demand.hpp"
#include "fluxring/stream/reactive.hpp"


namespace fluxring::stream {

// ============================================================================
// Demand policy
// ============================================================================
//
// strict   emitting past the downstream's authorised demand fails the stage
//          with CapacityExceeded (upstream is cancelled)
// lenient  the value is forwarded anyway; for operators whose upstream
//          contract intentionally over-requests (retry asks for one extra)
// ============================================================================

enum class demand_policy {
    strict,
    lenient
};

// ============================================================================
// stage<In, Out>
// ============================================================================
//
// Common plumbing for one-upstream / one-downstream operators:
//
//   - downstream demand bookkeeping (saturating at UNBOUNDED)
//   - upstream subscription ownership; requests issued before the upstream
//     arrives are deferred and replayed on on_subscribe
//   - request(n <= 0) is a ProtocolViolation
//   - exactly-once terminal forwarding: nothing follows on_error/on_complete
//
// Operators override do_next() and, where needed, do_on_subscribe(),
// do_error(), do_complete(), do_cancel() and request_more().
//
// Stages are always owned by std::shared_ptr (subscribe() hands out handles
// derived from weak_from_this()).
// ============================================================================
template <typename In, typename Out>
class stage
    : public subscriber<In>
    , public publisher<Out>
    , public std::enable_shared_from_this<stage<In, Out>>
{
    // Handle given to the downstream subscriber
    class handle final : public subscription {
    public:
        explicit handle(std::weak_ptr<stage> owner) : owner_(std::move(owner)) {}

        void request(std::int64_t n) override {
            if (auto owner = owner_.lock()) {
                owner->request(n);
            }
        }

        void cancel() override {
            if (auto owner = owner_.lock()) {
                owner->cancel();
            }
        }

    private:
        std::weak_ptr<stage> owner_;
    };

public:
    explicit stage(demand_policy policy = demand_policy::strict)
        : policy_(policy)
        , demand_(0)
        , deferred_(0)
    {}

    ~stage() override = default;

    // -------------------------------------------------------------------------
    // publisher<Out>
    // -------------------------------------------------------------------------

    // Single downstream; must be attached before upstream starts emitting
    void subscribe(std::shared_ptr<subscriber<Out>> s) override {
        if (downstream_) {
            s->on_error(error{error_code::ProtocolViolation, "stage accepts a single subscriber"});
            return;
        }
        downstream_ = std::move(s);
        downstream_->on_subscribe(std::make_shared<handle>(this->weak_from_this()));
    }

    // -------------------------------------------------------------------------
    // Downstream demand
    // -------------------------------------------------------------------------

    void request(std::int64_t n) {
        if (n <= 0) [[unlikely]] {
            FR_WARN("[stage] request(" << n << ") violates the subscription contract");
            cancel_upstream();
            emit_error(error{error_code::ProtocolViolation,
                             "request(n) requires n > 0, got " + std::to_string(n)});
            return;
        }
        add_demand(demand_, n);
        request_more(n);
    }

    void cancel() {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        cancel_upstream();
        do_cancel();
    }

    // -------------------------------------------------------------------------
    // subscriber<In>
    // -------------------------------------------------------------------------

    void on_subscribe(std::shared_ptr<subscription> s) override {
        if (cancelled_.load(std::memory_order_acquire)) {
            s->cancel();
            return;
        }
        {
            std::lock_guard<std::mutex> lock(upstream_mutex_);
            upstream_ = s;
        }
        do_on_subscribe(*s);
    }

    void on_next(const In& value) override {
        if (is_terminated()) [[unlikely]] {
            return;
        }
        do_next(value);
    }

    void on_error(const error& cause) override {
        if (is_terminated()) {
            return;
        }
        do_error(cause);
    }

    void on_complete() override {
        if (is_terminated()) {
            return;
        }
        do_complete();
    }

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    [[nodiscard]] bool is_terminated() const noexcept { return terminated_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Outstanding downstream demand
    [[nodiscard]] std::int64_t requested() const noexcept { return demand_.get(); }

protected:
    // Default: replay demand requested before the upstream arrived
    virtual void do_on_subscribe(subscription& s) {
        std::int64_t deferred = 0;
        {
            std::lock_guard<std::mutex> lock(upstream_mutex_);
            deferred = deferred_.get();
            deferred_.set(0);
        }
        if (deferred > 0) {
            s.request(deferred);
        }
    }

    virtual void do_next(const In& value) = 0;

    virtual void do_error(const error& cause) {
        emit_error(cause);
    }

    virtual void do_complete() {
        emit_complete();
    }

    virtual void do_cancel() {}

    // Forward upstream, or defer until the upstream subscription arrives
    void forward_request(std::int64_t n) {
        std::shared_ptr<subscription> upstream;
        {
            std::lock_guard<std::mutex> lock(upstream_mutex_);
            if (!upstream_) {
                add_demand(deferred_, n);
                return;
            }
            upstream = upstream_;
        }
        upstream->request(n);
    }

    // Translate downstream demand into upstream demand (1:1 by default)
    virtual void request_more(std::int64_t n) {
        forward_request(n);
    }

    // -------------------------------------------------------------------------
    // Emission helpers
    // -------------------------------------------------------------------------

    void emit_next(const Out& value) {
        if (is_terminated() || !downstream_) [[unlikely]] {
            return;
        }
        if (!try_consume_demand(demand_) && policy_ == demand_policy::strict) [[unlikely]] {
            FR_ERROR("[stage] emission past requested demand");
            cancel_upstream();
            emit_error(error{error_code::CapacityExceeded, "emission exceeded requested demand"});
            return;
        }
        downstream_->on_next(value);
    }

    void emit_error(const error& cause) {
        if (terminated_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        release_upstream_();
        if (downstream_) {
            downstream_->on_error(cause);
        }
    }

    void emit_complete() {
        if (terminated_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        release_upstream_();
        if (downstream_) {
            downstream_->on_complete();
        }
    }

    // Cancel and forget the current upstream subscription
    void cancel_upstream() {
        std::shared_ptr<subscription> upstream;
        {
            std::lock_guard<std::mutex> lock(upstream_mutex_);
            upstream = std::move(upstream_);
        }
        if (upstream) {
            upstream->cancel();
        }
    }

    [[nodiscard]] std::shared_ptr<subscription> upstream() const {
        std::lock_guard<std::mutex> lock(upstream_mutex_);
        return upstream_;
    }

private:
    void release_upstream_() {
        std::lock_guard<std::mutex> lock(upstream_mutex_);
        upstream_.reset();
    }

private:
    const demand_policy policy_;
    std::shared_ptr<subscriber<Out>> downstream_;

    lcr::sequence demand_;
    lcr::sequence deferred_;

    mutable std::mutex upstream_mutex_;
    std::shared_ptr<subscription> upstream_;

    std::atomic<bool> terminated_{false};
    std::atomic<bool> cancelled_{false};
};

} // namespace fluxring::stream
