#pragma once

/**
 * @file config.hpp
 * @brief Thread pool configuration
 */

#include <cstddef>
#include <string>
#include <thread>

namespace threaded {

/**
 * @brief Configuration for a thread pool
 */
struct ThreadPoolConfig {
    std::size_t capacity{0};         // number of workers, must be > 0
    std::string name{"threaded"};    // prefix used in log lines
    bool log_job_failures{true};     // log exceptions escaping a job
};

/**
 * @brief One worker per hardware thread, or 4 when that is unknown
 */
inline std::size_t default_capacity() noexcept {
    auto n = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return n == 0 ? 4 : n;
}

} // namespace threaded
