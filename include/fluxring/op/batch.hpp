#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "lcr/time_unit.hpp"
#include "lcr/log/logger.hpp"
#include "fluxring/error.hpp"
#include "fluxring/config/batch.hpp"
#include "fluxring/stream/stage.hpp"
#include "fluxring/timer/timer.hpp"


namespace fluxring::op {

// What the completion path does when the current window is empty
enum class empty_flush {
    always,     // one final flush_callback(nullptr), even for an empty window
    suppress    // final flush only when values are pending
};

constexpr const char* to_string(empty_flush p) noexcept {
    switch (p) {
        case empty_flush::always:   return "always";
        case empty_flush::suppress: return "suppress";
        default:                    return "unknown";
    }
}

struct batch_config {
    std::size_t batch_size = config::batch::DEFAULT_BATCH_SIZE;

    // Which callbacks are invoked
    bool next  = true;
    bool first = false;
    bool flush = true;

    // Time-based closing (disabled when timespan <= 0 or no timer)
    std::int64_t   timespan = config::batch::NO_TIMESPAN;
    lcr::time_unit unit     = config::batch::DEFAULT_UNIT;
    std::shared_ptr<fluxring::timer::timer> timer;

    empty_flush on_empty_complete = empty_flush::always;

    [[nodiscard]] bool timed() const noexcept {
        return timer != nullptr && timespan > 0;
    }
};

// -----------------------------------------------------------------------------
// batch<T, V>
// -----------------------------------------------------------------------------
//
// Groups the upstream sequence into windows closed by count (batch_size) and,
// when a timer is configured, by elapsed time since the first value of the
// window.
//
//   value arrives    index += 1
//                    index == 1         -> schedule flush timer, first_callback
//                    next               -> next_callback
//                    index == size      -> cancel timer, index = 0,
//                                          flush_callback(&value)
//   timer fires      index == 0         -> no-op (closed by count)
//                    otherwise          -> index = 0, flush_callback(nullptr)
//   upstream done    cancel timer, final flush_callback(nullptr), complete
//
// Window state is guarded by a recursive mutex when time-based closing is
// enabled (callbacks may emit downstream, which may request more, which may
// re-enter on a synchronous upstream). Each scheduled flush carries the window
// generation it was armed for; a stale fire never closes a newer window.
// -----------------------------------------------------------------------------
template <typename T, typename V>
class batch : public stream::stage<T, V> {
public:
    explicit batch(batch_config cfg)
        : stream::stage<T, V>(stream::demand_policy::strict)
        , cfg_(validate_(std::move(cfg)))
    {}

    ~batch() override {
        if (registration_) {
            registration_->cancel();
        }
    }

    [[nodiscard]] const batch_config& settings() const noexcept { return cfg_; }

    [[nodiscard]] std::size_t batch_size() const noexcept { return cfg_.batch_size; }

    // Values in the current window
    [[nodiscard]] std::size_t index() const {
        auto lock = lock_window_();
        return index_;
    }

    [[nodiscard]] std::string describe() const {
        auto lock = lock_window_();
        std::ostringstream oss;
        oss << '{';
        if (cfg_.timed()) {
            oss << "timed - " << cfg_.timespan << ' ' << lcr::to_string(cfg_.unit) << ' ';
        }
        oss << "batch_size=" << index_ << '/' << cfg_.batch_size
            << " [" << (index_ * 100 / cfg_.batch_size) << "%]}";
        return oss.str();
    }

protected:
    virtual void first_callback(const T&) {}
    virtual void next_callback(const T&) {}

    // `last` is the value that closed the window by count, nullptr when the
    // window was closed by time or by completion
    virtual void flush_callback(const T* last) = 0;

    void do_next(const T& value) override {
        auto lock = lock_window_();

        const std::size_t index = ++index_;
        if (index == 1) {
            if (cfg_.timed()) {
                schedule_flush_();
            }
            if (cfg_.first) {
                first_callback(value);
            }
        }

        if (cfg_.next) {
            next_callback(value);
        }

        if (index % cfg_.batch_size == 0) {
            cancel_flush_();
            index_ = 0;
            if (cfg_.flush) {
                flush_callback(&value);
            }
        }
    }

    void do_complete() override {
        {
            auto lock = lock_window_();
            const bool pending = index_ != 0;
            close_window_();
            if (pending || cfg_.on_empty_complete == empty_flush::always) {
                flush_callback(nullptr);
            }
        }
        this->emit_complete();
    }

    void do_error(const error& cause) override {
        {
            auto lock = lock_window_();
            close_window_();
        }
        this->emit_error(cause);
    }

    void do_cancel() override {
        auto lock = lock_window_();
        close_window_();
    }

private:
    static batch_config validate_(batch_config cfg) {
        if (cfg.batch_size == 0) {
            throw exception(error_code::InvalidConfig, "batch_size must be positive");
        }
        return cfg;
    }

    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock_window_() const {
        if (cfg_.timed()) {
            return std::unique_lock<std::recursive_mutex>(window_mutex_);
        }
        return std::unique_lock<std::recursive_mutex>();
    }

    // Caller holds the window lock
    void schedule_flush_() {
        const std::uint64_t generation = ++generation_;
        std::weak_ptr<stream::stage<T, V>> weak = this->weak_from_this();
        registration_ = cfg_.timer->submit(
            [weak, generation]() {
                if (auto self = weak.lock()) {
                    static_cast<batch*>(self.get())->on_timer_(generation);
                }
            },
            cfg_.timespan, cfg_.unit);
    }

    // Caller holds the window lock
    void cancel_flush_() noexcept {
        if (registration_) {
            registration_->cancel();
            registration_.reset();
        }
    }

    // Caller holds the window lock. A timer task already past its cancel check
    // finds a newer generation and an empty window.
    void close_window_() noexcept {
        cancel_flush_();
        ++generation_;
        index_ = 0;
    }

    void on_timer_(std::uint64_t generation) {
        auto lock = lock_window_();
        if (generation != generation_ || index_ == 0 || this->is_terminated() || this->is_cancelled()) {
            return;
        }
        FR_TRACE("[batch] window closed by time with " << index_ << " value(s)");
        index_ = 0;
        registration_.reset();
        flush_callback(nullptr);
    }

private:
    const batch_config cfg_;

    mutable std::recursive_mutex window_mutex_;
    std::size_t index_ = 0;
    std::uint64_t generation_ = 0;
    std::shared_ptr<timer::registration> registration_;
};

} // namespace fluxring::op
