#include "fluxring/error.hpp"


namespace fluxring {

std::string_view to_string(error_code code) noexcept {
    switch (code) {
        case error_code::None:              return "None";
        case error_code::Upstream:          return "Upstream";
        case error_code::CapacityExceeded:  return "CapacityExceeded";
        case error_code::ProtocolViolation: return "ProtocolViolation";
        case error_code::InvalidCapacity:   return "InvalidCapacity";
        case error_code::InvalidConfig:     return "InvalidConfig";
    }
    return "Unknown";
}

} // namespace fluxring
