#pragma once

/**
 * @file logging.hpp
 * @brief Logging helpers on top of spdlog
 */

#include <spdlog/spdlog.h>

namespace threaded {

/**
 * @brief Set the verbosity of thread pool diagnostics
 *
 * Pools log through the default spdlog logger, so this affects every
 * logger user in the process.
 */
inline void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace threaded
