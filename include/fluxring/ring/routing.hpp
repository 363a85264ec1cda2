#pragma once

#include <cstdint>
#include <optional>
#include <thread>
#include <utility>

#include "fluxring/signal.hpp"
#include "fluxring/config/ring.hpp"
#include "fluxring/ring/ring_buffer.hpp"
#include "fluxring/stream/reactive.hpp"


namespace fluxring::ring {

/*
===============================================================================
 Signal routing utilities
===============================================================================

Stateless helpers shared by every stage that stores reactive signals in a
ring_buffer<signal<T>>.

Producer side (single logical producer per ring):
  publish_next / publish_error / publish_complete
      claim one slot, overwrite tag and both payload fields, publish.
  claim_next + publish
      two-phase variant: the caller fills the returned Next slot in place.

Consumer side:
  route       dispatch a slot to a subscriber by tag
  route_once  same, but moves the payload out of the slot first and puts it
              back if the subscriber throws
  await_demand_or_terminal
      park a consumer that has no authorised demand yet, while still
      delivering a terminal signal promptly

Dispatch order is Next, Complete, Error (most to least frequent).
===============================================================================
*/

namespace detail {

// On a failed payload copy the slot degrades to an empty Next, which route()
// skips, so the published sequence never carries a stale value.
template <typename T, typename V>
inline void populate_next(signal<T>& slot, V&& value) {
    slot.error = {};
    slot.type = signal_type::Next;
    try {
        slot.value = std::forward<V>(value);
    } catch (...) {
        slot.value.reset();
        throw;
    }
}

} // namespace detail

// -----------------------------------------------------------------------------
// Producer side
// -----------------------------------------------------------------------------

template <typename T, WaitStrategy W, typename V>
inline void publish_next(V&& value, ring_buffer<signal<T>, W>& ring) {
    auto claim = ring.claim();
    detail::populate_next(claim[claim.last()], std::forward<V>(value));
}

// Eager demand replenishment: after publishing, ask upstream for as many items
// as the ring can currently absorb.
template <typename T, WaitStrategy W, typename V>
inline void publish_next(V&& value, ring_buffer<signal<T>, W>& ring, stream::subscription* upstream) {
    {
        auto claim = ring.claim();
        detail::populate_next(claim[claim.last()], std::forward<V>(value));
    }
    if (upstream != nullptr) {
        const std::int64_t remaining = ring.cached_remaining_capacity();
        if (remaining > 0) {
            upstream->request(remaining);
        }
    }
}

template <typename T, WaitStrategy W>
inline void publish_error(const error& cause, ring_buffer<signal<T>, W>& ring) {
    auto claim = ring.claim();
    auto& slot = claim[claim.last()];
    slot.type = signal_type::Error;
    slot.value.reset();
    slot.error = cause;
}

template <typename T, WaitStrategy W>
inline void publish_complete(ring_buffer<signal<T>, W>& ring) {
    auto claim = ring.claim();
    auto& slot = claim[claim.last()];
    slot.type = signal_type::Complete;
    slot.value.reset();
    slot.error = {};
}

// Claims one slot tagged Next and stamped with its sequence.
// The caller MUST hand it back through publish(ring, slot).
template <typename T, WaitStrategy W>
[[nodiscard]] inline signal<T>& claim_next(ring_buffer<signal<T>, W>& ring) {
    const std::int64_t seq = ring.next();
    auto& slot = ring.get(seq);
    slot.type = signal_type::Next;
    slot.error = {};
    slot.sequence = seq;
    return slot;
}

template <typename T, WaitStrategy W>
inline void publish(ring_buffer<signal<T>, W>& ring, const signal<T>& slot) noexcept {
    ring.publish(slot.sequence);
}

// -----------------------------------------------------------------------------
// Consumer side
// -----------------------------------------------------------------------------

template <typename T>
inline void route(const signal<T>& slot, stream::subscriber<T>& s) {
    if (slot.type == signal_type::Next && slot.value.has_value()) [[likely]] {
        s.on_next(*slot.value);
    }
    else if (slot.type == signal_type::Complete) {
        s.on_complete();
    }
    else if (slot.type == signal_type::Error) {
        s.on_error(slot.error);
    }
}

// The slot no longer references the value while the subscriber runs; if the
// subscriber throws, the value is restored and the exception propagates.
template <typename T>
inline void route_once(signal<T>& slot, stream::subscriber<T>& s) {
    std::optional<T> value = std::move(slot.value);
    slot.value.reset();
    try {
        if (slot.type == signal_type::Next && value.has_value()) [[likely]] {
            s.on_next(*value);
        }
        else if (slot.type == signal_type::Complete) {
            s.on_complete();
        }
        else if (slot.type == signal_type::Error) {
            s.on_error(slot.error);
        }
    } catch (...) {
        slot.value = std::move(value);
        throw;
    }
}

// -----------------------------------------------------------------------------
// await_demand_or_terminal
// -----------------------------------------------------------------------------
//
// Parks the calling consumer while `pending()` is negative (no demand authorised
// yet). The signal after the current cursor (or the cursor itself when that is
// already terminal) is inspected once it is published:
//
//   Complete / Error   dispatched to `s` without demand, returns false
//   barrier alerted    returns false, nothing is dispatched
//   demand arrives     returns true, also after a Next was inspected
//
// The barrier is polled, never waited on, so demand is noticed on every park.
// `pending` is any callable returning the outstanding demand minus one.
// The caller's gating sequence must sit below the cursor at entry, so the
// inspected slot cannot be overwritten.
// -----------------------------------------------------------------------------
template <typename Pending, typename T, WaitStrategy W>
[[nodiscard]] bool await_demand_or_terminal(Pending&& pending,
                                            ring_buffer<signal<T>, W>& ring,
                                            sequence_barrier<W>& barrier,
                                            stream::subscriber<T>& s)
{
    const std::int64_t cursor = ring.cursor();
    const std::int64_t waited = (cursor >= 0 && ring.get(cursor).is_terminal()) ? cursor : cursor + 1;

    bool inspected = false;
    while (pending() < 0) {
        if (barrier.check_alert()) {
            return false;
        }
        if (!inspected && barrier.cursor() >= waited) {
            const signal<T>& ev = ring.get(waited);
            if (ev.type == signal_type::Complete) {
                s.on_complete();
                return false;
            }
            if (ev.type == signal_type::Error) {
                s.on_error(ev.error);
                return false;
            }
            inspected = true;
        }
        std::this_thread::sleep_for(config::ring::DEMAND_PARK);
    }
    return true;
}

} // namespace fluxring::ring
