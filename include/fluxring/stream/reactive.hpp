#pragma once

#include <cstdint>
#include <memory>

#include "fluxring/error.hpp"


namespace fluxring::stream {

// -----------------------------------------------------------------------------
// Reactive boundary contracts
// -----------------------------------------------------------------------------
//
//   publisher::subscribe(s)
//     -> s.on_subscribe(subscription)
//     -> s.on_next(v) *                 (never more than requested)
//     -> s.on_complete() | s.on_error(e) (exactly one, terminal)
//
// subscription::request(n) authorises n more values; n <= 0 is a protocol
// violation reported through on_error(ProtocolViolation).
// subscription::cancel() is idempotent and may be called from any thread.
//
// Signals on one subscriber are serialized by the producer side.
// -----------------------------------------------------------------------------

class subscription {
public:
    virtual ~subscription() = default;

    virtual void request(std::int64_t n) = 0;
    virtual void cancel() = 0;
};

template <typename T>
class subscriber {
public:
    using value_type = T;

    virtual ~subscriber() = default;

    virtual void on_subscribe(std::shared_ptr<subscription> s) = 0;
    virtual void on_next(const T& value) = 0;
    virtual void on_error(const error& cause) = 0;
    virtual void on_complete() = 0;
};

template <typename T>
class publisher {
public:
    using value_type = T;

    virtual ~publisher() = default;

    virtual void subscribe(std::shared_ptr<subscriber<T>> s) = 0;
};

// -----------------------------------------------------------------------------
// Capacity introspection
// -----------------------------------------------------------------------------
// Implemented by components with a known buffering capacity so a bridge can
// size its initial demand without guessing.
class bounded {
public:
    virtual ~bounded() = default;

    // True when `upstream` may overrun this component's buffer
    [[nodiscard]] virtual bool is_exposed_to_overflow(const bounded* upstream) const noexcept = 0;

    [[nodiscard]] virtual std::int64_t capacity() const noexcept = 0;
};

} // namespace fluxring::stream
