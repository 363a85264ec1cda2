#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>


namespace fluxring {

/*
===============================================================================
 fluxring::error_code
===============================================================================

Classification of failures observable at a stage boundary.

Upstream            An explicit error signal produced by a source. Recoverable
                    by op::retry within its budget/predicate, otherwise
                    forwarded verbatim downstream.

CapacityExceeded    A producer delivered more values than were authorised
                    (demand overflow). Distinct from Upstream so retry
                    predicates can refuse to treat it as retryable.

ProtocolViolation   A caller broke the subscription contract (request(n <= 0),
                    claim of more slots than the ring holds, ...). Fails fast.

InvalidCapacity     Ring buffer capacity is not a power of two.

InvalidConfig       A runtime profile could not be applied.

Cancellation is NOT an error: an alerted barrier reports wait_status::Alerted
and the stage exits silently.
===============================================================================
*/

enum class error_code {
    None = 0,
    Upstream,
    CapacityExceeded,
    ProtocolViolation,
    InvalidCapacity,
    InvalidConfig
};

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

// -----------------------------------------------------------------------------
// Error value carried by Error signals
// -----------------------------------------------------------------------------
struct error {
    error_code code = error_code::None;
    std::string message;

    [[nodiscard]] inline bool empty() const noexcept { return code == error_code::None; }

    [[nodiscard]] static error upstream(std::string msg) {
        return error{error_code::Upstream, std::move(msg)};
    }
};

[[nodiscard]] inline bool operator==(const error& a, const error& b) noexcept {
    return a.code == b.code && a.message == b.message;
}

// -----------------------------------------------------------------------------
// Construction / contract failures that cannot be reported as a signal
// -----------------------------------------------------------------------------
class exception : public std::runtime_error {
public:
    exception(error_code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }

private:
    error_code code_;
};

} // namespace fluxring
