#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "lcr/time_unit.hpp"
#include "lcr/log/logger.hpp"
#include "fluxring/config/ring.hpp"
#include "fluxring/config/batch.hpp"
#include "fluxring/op/batch.hpp"

/*
================================================================================
Pipeline profile
================================================================================

Runtime tuning for one ring buffer pipeline, loaded from a JSON document:

    {
      "ring_capacity": 1024,        // rounded up to a power of two
      "wait_strategy": "parking",   // "busy_spin" | "yielding" | "parking"
      "batch_size":    32,
      "timespan":      50,          // <= 0 disables time-based windows
      "unit":          "ms",        // "ns" | "us" | "ms" | "s"
      "retries":       3,           // -1 = unlimited
      "empty_flush":   "always",    // "always" | "suppress"
      "log_level":     "info"
    }

Every field is optional; missing fields keep the compile-time defaults.
Unknown fields are ignored.

The loader never throws; it returns a result code. A ring_capacity that is not
a power of two is rounded up with a warning. load_profile() additionally logs
the outcome.
================================================================================
*/

namespace fluxring::config {

enum class wait_kind : std::uint8_t {
    busy_spin,
    yielding,
    parking
};

[[nodiscard]] constexpr std::string_view to_string(wait_kind w) noexcept {
    switch (w) {
        case wait_kind::busy_spin: return "busy_spin";
        case wait_kind::yielding:  return "yielding";
        case wait_kind::parking:   return "parking";
        default:                   return "unknown";
    }
}

enum class result : std::uint8_t {
    Ok = 0,
    FileNotFound,     // Document could not be read
    InvalidJson,      // Structural failure
    InvalidSchema,    // Root is not an object, or a field has the wrong type
    InvalidValue      // Field present but semantically invalid
};

[[nodiscard]] constexpr std::string_view to_string(result r) noexcept {
    switch (r) {
        case result::Ok:            return "Ok";
        case result::FileNotFound:  return "FileNotFound";
        case result::InvalidJson:   return "InvalidJson";
        case result::InvalidSchema: return "InvalidSchema";
        case result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

struct profile {
    std::size_t      ring_capacity = ring::DEFAULT_CAPACITY;
    wait_kind        wait          = wait_kind::parking;
    std::size_t      batch_size    = batch::DEFAULT_BATCH_SIZE;
    std::int64_t     timespan      = batch::NO_TIMESPAN;
    lcr::time_unit   unit          = batch::DEFAULT_UNIT;
    std::int64_t     retries       = -1;
    op::empty_flush  on_empty_complete = op::empty_flush::always;
    lcr::log::Level  log_level     = lcr::log::Level::Info;
};

// Parses `json` into `out`. On failure `out` is left partially updated and
// `field` names the offending key (empty for structural failures).
[[nodiscard]] result parse_profile(std::string_view json, profile& out, std::string& field);

[[nodiscard]] result parse_profile(std::string_view json, profile& out);

// Reads and parses the file at `path`
[[nodiscard]] result load_profile(const std::string& path, profile& out);

} // namespace fluxring::config
