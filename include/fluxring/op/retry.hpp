#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "lcr/sequence.hpp"
#include "lcr/log/logger.hpp"
#include "fluxring/error.hpp"
#include "fluxring/stream/demand.hpp"
#include "fluxring/stream/stage.hpp"


namespace fluxring::op {

// -----------------------------------------------------------------------------
// retry<T>
// -----------------------------------------------------------------------------
//
// On an upstream error, either re-subscribes itself to the root source or
// terminates:
//
//   count += 1
//   num_retries != UNLIMITED && count > num_retries
//       && (no predicate || predicate rejects)   -> forward error, shut down
//   otherwise                                    -> cancel upstream,
//                                                   root->subscribe(this)
//
// A delivered value resets the error run (count = 0) and consumes one unit of
// the pending request count, which survives resubscription. Every new upstream
// is asked for pending + 1 (or UNBOUNDED).
//
// Resubscription is trampolined: a root that fails synchronously inside
// subscribe() is re-subscribed from the outermost frame, not recursively.
// -----------------------------------------------------------------------------
template <typename T>
class retry final : public stream::stage<T, T> {
public:
    using predicate = std::function<bool(const error&)>;

    static constexpr std::int64_t UNLIMITED = -1;

    retry(std::int64_t num_retries, predicate accept, std::shared_ptr<stream::publisher<T>> root)
        : stream::stage<T, T>(stream::demand_policy::lenient)
        , num_retries_(num_retries)
        , accept_(std::move(accept))
        , root_(std::move(root))
        , pending_requests_(0)
    {
        if (num_retries_ < UNLIMITED) {
            throw exception(error_code::InvalidConfig, "num_retries must be >= -1");
        }
        if (!root_) {
            throw exception(error_code::InvalidConfig, "retry requires a root publisher");
        }
    }

    // Subscribe to the root source (first attempt)
    void connect() {
        resubscribe_();
    }

    [[nodiscard]] std::int64_t current_retries() const noexcept {
        return current_retries_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::int64_t pending_requests() const noexcept {
        return pending_requests_.get();
    }

protected:
    void do_on_subscribe(stream::subscription& s) override {
        const std::int64_t pending = pending_requests_.get();
        s.request(pending != stream::UNBOUNDED ? pending + 1 : pending);
    }

    void do_next(const T& value) override {
        current_retries_.store(0, std::memory_order_release);
        this->emit_next(value);
        consume_pending_();
    }

    void do_error(const error& cause) override {
        const std::int64_t attempt = current_retries_.fetch_add(1, std::memory_order_acq_rel) + 1;

        if (num_retries_ != UNLIMITED && attempt > num_retries_ && (!accept_ || !accept_(cause))) {
            FR_WARN("[retry] budget of " << num_retries_ << " exhausted: " << cause.message);
            current_retries_.store(0, std::memory_order_release);
            this->cancel_upstream();
            this->emit_error(cause);
            return;
        }

        FR_DEBUG("[retry] resubscribing (attempt " << attempt << ") after: " << cause.message);
        this->cancel_upstream();
        resubscribe_();
    }

    void request_more(std::int64_t n) override {
        stream::add_demand(pending_requests_, n);
        if (auto upstream = this->upstream()) {
            upstream->request(n);
        }
    }

private:
    void resubscribe_() {
        if (wip_.fetch_add(1, std::memory_order_acq_rel) != 0) {
            return;
        }
        std::shared_ptr<stream::subscriber<T>> self = this->shared_from_this();
        do {
            if (this->is_terminated() || this->is_cancelled()) {
                wip_.store(0, std::memory_order_release);
                return;
            }
            root_->subscribe(self);
        } while (wip_.fetch_sub(1, std::memory_order_acq_rel) != 1);
    }

    void consume_pending_() noexcept {
        while (true) {
            const std::int64_t current = pending_requests_.get();
            if (current == stream::UNBOUNDED || current <= 0) {
                return;
            }
            if (pending_requests_.compare_and_set(current, current - 1)) {
                return;
            }
        }
    }

private:
    const std::int64_t num_retries_;
    const predicate accept_;
    const std::shared_ptr<stream::publisher<T>> root_;

    lcr::sequence pending_requests_;
    std::atomic<std::int64_t> current_retries_{0};
    std::atomic<int> wip_{0};
};

template <typename T>
[[nodiscard]] std::shared_ptr<retry<T>> make_retry(std::int64_t num_retries,
                                                   std::shared_ptr<stream::publisher<T>> root,
                                                   typename retry<T>::predicate accept = {}) {
    return std::make_shared<retry<T>>(num_retries, std::move(accept), std::move(root));
}

} // namespace fluxring::op
