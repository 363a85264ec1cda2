#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "fluxring/timer/timer.hpp"


namespace fluxring::timer {

// -----------------------------------------------------------------------------
// thread_timer
// -----------------------------------------------------------------------------
//
// Single background thread serving a deadline-ordered queue.
//
//   - started on construction, stopped and joined on destruction (or stop())
//   - tasks run outside the internal lock, so a task may submit() again
//   - cancelled tasks are discarded when their deadline is reached
//   - tasks still queued at stop() never run
// -----------------------------------------------------------------------------
class thread_timer final : public timer {
public:
    thread_timer();
    ~thread_timer() override;

    thread_timer(const thread_timer&) = delete;
    thread_timer& operator=(const thread_timer&) = delete;

    [[nodiscard]] std::shared_ptr<registration> submit(task fn, std::int64_t delay, lcr::time_unit unit) override;

    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // Number of tasks waiting for their deadline (cancelled ones included)
    [[nodiscard]] std::size_t pending() const;

private:
    class entry;

    struct scheduled {
        std::chrono::steady_clock::time_point deadline;
        std::uint64_t order;
        std::shared_ptr<entry> task;
    };

    struct later {
        bool operator()(const scheduled& a, const scheduled& b) const noexcept {
            return a.deadline != b.deadline ? a.deadline > b.deadline : a.order > b.order;
        }
    };

    void run_loop_();

private:
    std::atomic<bool> running_{false};

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::priority_queue<scheduled, std::vector<scheduled>, later> queue_;
    std::uint64_t order_ = 0;

    std::thread worker_;
};

} // namespace fluxring::timer
