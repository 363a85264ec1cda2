#include "fluxring/config/profile.hpp"

#include "lcr/numbers.hpp"

#include "simdjson.h"


namespace fluxring::config {

namespace {

// ------------------------------------------------------------
// Optional primitive fields: absent keys leave `out` untouched
// ------------------------------------------------------------

[[nodiscard]]
result parse_int64_optional(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return result::Ok;
    }
    std::int64_t tmp{};
    if (field.get(tmp)) {
        return result::InvalidSchema;
    }
    out = tmp;
    return result::Ok;
}

[[nodiscard]]
result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return result::Ok;
    }
    if (field.get(out)) {
        return result::InvalidSchema;
    }
    present = true;
    return result::Ok;
}

[[nodiscard]]
bool parse_wait_kind(std::string_view s, wait_kind& out) noexcept {
    if (s == "busy_spin") { out = wait_kind::busy_spin; return true; }
    if (s == "yielding")  { out = wait_kind::yielding;  return true; }
    if (s == "parking")   { out = wait_kind::parking;   return true; }
    return false;
}

[[nodiscard]]
bool parse_empty_flush(std::string_view s, op::empty_flush& out) noexcept {
    if (s == "always")   { out = op::empty_flush::always;   return true; }
    if (s == "suppress") { out = op::empty_flush::suppress; return true; }
    return false;
}

[[nodiscard]]
bool is_known_level(std::string_view s) noexcept {
    return s == "trace" || s == "debug" || s == "info" || s == "warn" || s == "error" || s == "fatal";
}

// Walks the root object; `field` is set to the key being examined
result parse_root(const simdjson::dom::element& root, profile& out, std::string& field) {
    if (root.type() != simdjson::dom::element_type::OBJECT) {
        return result::InvalidSchema;
    }

    std::int64_t number = 0;
    std::string_view text;
    bool present = false;

    // ring_capacity
    field = "ring_capacity";
    number = static_cast<std::int64_t>(out.ring_capacity);
    if (auto r = parse_int64_optional(root, "ring_capacity", number); r != result::Ok) {
        return r;
    }
    if (number < 1) {
        return result::InvalidValue;
    }
    const auto requested = static_cast<std::uint64_t>(number);
    if (!lcr::is_power_of_two(requested)) {
        const auto rounded = lcr::round_up_to_power_of_two_64(requested);
        FR_WARN("[profile] ring_capacity " << requested << " rounded up to " << rounded);
        out.ring_capacity = static_cast<std::size_t>(rounded);
    } else {
        out.ring_capacity = static_cast<std::size_t>(requested);
    }

    // wait_strategy
    field = "wait_strategy";
    if (auto r = parse_string_optional(root, "wait_strategy", text, present); r != result::Ok) {
        return r;
    }
    if (present && !parse_wait_kind(text, out.wait)) {
        return result::InvalidValue;
    }

    // batch_size
    field = "batch_size";
    number = static_cast<std::int64_t>(out.batch_size);
    if (auto r = parse_int64_optional(root, "batch_size", number); r != result::Ok) {
        return r;
    }
    if (number < 1) {
        return result::InvalidValue;
    }
    out.batch_size = static_cast<std::size_t>(number);

    // timespan (non-positive disables time windows)
    field = "timespan";
    if (auto r = parse_int64_optional(root, "timespan", out.timespan); r != result::Ok) {
        return r;
    }

    // unit
    field = "unit";
    if (auto r = parse_string_optional(root, "unit", text, present); r != result::Ok) {
        return r;
    }
    if (present) {
        const auto unit = lcr::parse_time_unit(text);
        if (!unit) {
            return result::InvalidValue;
        }
        out.unit = *unit;
    }

    // retries
    field = "retries";
    if (auto r = parse_int64_optional(root, "retries", out.retries); r != result::Ok) {
        return r;
    }
    if (out.retries < -1) {
        return result::InvalidValue;
    }

    // empty_flush
    field = "empty_flush";
    if (auto r = parse_string_optional(root, "empty_flush", text, present); r != result::Ok) {
        return r;
    }
    if (present && !parse_empty_flush(text, out.on_empty_complete)) {
        return result::InvalidValue;
    }

    // log_level
    field = "log_level";
    if (auto r = parse_string_optional(root, "log_level", text, present); r != result::Ok) {
        return r;
    }
    if (present) {
        if (!is_known_level(text)) {
            return result::InvalidValue;
        }
        out.log_level = lcr::log::parse_level(text);
    }

    field.clear();
    return result::Ok;
}

} // namespace


result parse_profile(std::string_view json, profile& out, std::string& field) {
    field.clear();

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(json.data(), json.size()).get(root)) {
        return result::InvalidJson;
    }
    return parse_root(root, out, field);
}

result parse_profile(std::string_view json, profile& out) {
    std::string field;
    return parse_profile(json, out, field);
}

result load_profile(const std::string& path, profile& out) {
    simdjson::padded_string json;
    if (simdjson::padded_string::load(path).get(json)) {
        FR_ERROR("[profile] cannot read '" << path << "'");
        return result::FileNotFound;
    }

    std::string field;
    const result r = parse_profile(std::string_view(json.data(), json.size()), out, field);
    if (r != result::Ok) {
        FR_ERROR("[profile] '" << path << "': " << to_string(r)
                 << (field.empty() ? "" : " at '" + field + "'"));
    }
    else {
        FR_INFO("[profile] loaded '" << path << "' (ring_capacity=" << out.ring_capacity
                << ", wait=" << to_string(out.wait) << ", batch_size=" << out.batch_size << ")");
    }
    return r;
}

} // namespace fluxring::config
