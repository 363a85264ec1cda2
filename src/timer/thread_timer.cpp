#include "fluxring/timer/thread_timer.hpp"

#include <exception>
#include <utility>

#include "lcr/log/logger.hpp"


namespace fluxring::timer {

class thread_timer::entry final : public registration {
public:
    explicit entry(task fn) : fn_(std::move(fn)) {}

    void cancel() noexcept override {
        cancelled_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const noexcept override {
        return cancelled_.load(std::memory_order_acquire);
    }

    void run() {
        if (!is_cancelled()) {
            fn_();
        }
    }

private:
    task fn_;
    std::atomic<bool> cancelled_{false};
};


thread_timer::thread_timer() {
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&thread_timer::run_loop_, this);
    FR_DEBUG("[timer] started");
}

thread_timer::~thread_timer() {
    stop();
}

std::shared_ptr<registration> thread_timer::submit(task fn, std::int64_t delay, lcr::time_unit unit) {
    auto e = std::make_shared<entry>(std::move(fn));
    const auto deadline = std::chrono::steady_clock::now() + lcr::to_duration(delay, unit);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_.load(std::memory_order_acquire)) {
            FR_WARN("[timer] submit after stop, task discarded");
            e->cancel();
            return e;
        }
        queue_.push(scheduled{deadline, order_++, e});
    }
    cv_.notify_one();
    return e;
}

void thread_timer::stop() {
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false)) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cv_.notify_one();
        }
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
        FR_DEBUG("[timer] stopped");
    }
}

std::size_t thread_timer::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

void thread_timer::run_loop_() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (running_.load(std::memory_order_acquire)) {
        if (queue_.empty()) {
            cv_.wait(lk, [&] { return !running_.load(std::memory_order_acquire) || !queue_.empty(); });
            continue;
        }

        const auto deadline = queue_.top().deadline;
        if (std::chrono::steady_clock::now() < deadline) {
            cv_.wait_until(lk, deadline);
            continue;
        }

        std::shared_ptr<entry> due = queue_.top().task;
        queue_.pop();

        lk.unlock();
        try {
            due->run();
        } catch (const std::exception& ex) {
            FR_ERROR("[timer] task failed: " << ex.what());
        }
        lk.lock();
    }

    // Remaining tasks are dropped
    while (!queue_.empty()) {
        queue_.pop();
    }
}

} // namespace fluxring::timer
