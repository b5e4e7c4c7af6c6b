#pragma once

/**
 * @file threaded.hpp
 * @brief Main header for threaded - a minimal fixed-capacity thread pool
 *
 * Include this single header to access the full threaded API.
 */

#include "threaded/core/error.hpp"
#include "threaded/core/config.hpp"
#include "threaded/core/logging.hpp"
#include "threaded/core/job.hpp"
#include "threaded/core/message.hpp"
#include "threaded/core/channel.hpp"
#include "threaded/core/worker.hpp"
#include "threaded/core/thread_pool.hpp"

namespace threaded {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace threaded
