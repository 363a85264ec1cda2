#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "lcr/time_unit.hpp"


namespace fluxring::timer {

// -----------------------------------------------------------------------------
// Cancellable handle for one scheduled task.
// cancel() is idempotent and never waits for a task that is already running.
// -----------------------------------------------------------------------------
class registration {
public:
    virtual ~registration() = default;

    virtual void cancel() noexcept = 0;
    [[nodiscard]] virtual bool is_cancelled() const noexcept = 0;
};

// -----------------------------------------------------------------------------
// One-shot delayed task scheduler.
//
// Tasks run on a thread owned by the implementation. Callers that share state
// with a task must synchronise with it themselves.
// -----------------------------------------------------------------------------
class timer {
public:
    using task = std::function<void()>;

    virtual ~timer() = default;

    [[nodiscard]] virtual std::shared_ptr<registration> submit(task fn, std::int64_t delay, lcr::time_unit unit) = 0;
};

} // namespace fluxring::timer
