#pragma once

#include <cstddef>
#include <cstdint>

#include "lcr/time_unit.hpp"


namespace fluxring::config::batch {

// -----------------------------------------------------------------------------
// Batch operator defaults
// -----------------------------------------------------------------------------
// A non-positive timespan disables time-based window closing.
// When a timespan is given without a unit, seconds are assumed.

inline constexpr std::size_t    DEFAULT_BATCH_SIZE = 32;
inline constexpr std::int64_t   NO_TIMESPAN        = -1;
inline constexpr lcr::time_unit DEFAULT_UNIT       = lcr::time_unit::seconds;

} // namespace fluxring::config::batch
