#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "fluxring/error.hpp"


namespace fluxring {

/*
===============================================================================
 fluxring::signal<T>
===============================================================================

Mutable, reused ring buffer slot holding one reactive signal.

  Next      value holds the payload, error is empty
  Error     error holds the cause, value is empty
  Complete  value and error are both empty

Slots are preallocated by the ring buffer and overwritten in place; writers
replace the tag and BOTH payload fields before publishing. A consumer reads a
slot only after its sequence became available through a sequence barrier.

`sequence` is stamped by claim_next() for two-phase publication.
===============================================================================
*/

enum class signal_type : std::uint8_t {
    Next,
    Error,
    Complete
};

constexpr std::string_view to_string(signal_type t) noexcept {
    switch (t) {
        case signal_type::Next:     return "Next";
        case signal_type::Error:    return "Error";
        case signal_type::Complete: return "Complete";
    }
    return "Unknown";
}

template <typename T>
struct signal {
    signal_type type = signal_type::Next;
    std::optional<T> value;
    fluxring::error error;
    std::int64_t sequence = -1;

    [[nodiscard]] inline bool is_terminal() const noexcept {
        return type != signal_type::Next;
    }
};

} // namespace fluxring
