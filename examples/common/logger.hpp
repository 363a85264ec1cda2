#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace fluxring::examples {

    inline void set_log_level(const std::string& log_level) {
        lcr::log::Logger::instance().set_level(lcr::log::parse_level(log_level));
    }

} // namespace fluxring::examples
