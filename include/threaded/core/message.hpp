#pragma once

/**
 * @file message.hpp
 * @brief Control messages carried from the pool to its workers
 */

#include <variant>

#include "threaded/core/job.hpp"

namespace threaded {

/**
 * @brief Run the carried job on whichever worker receives the message
 */
struct RunJob {
    Job job;
};

/**
 * @brief Poison pill telling the receiving worker to exit its loop
 */
struct Stop {};

/**
 * @brief Job or termination signal
 */
using Message = std::variant<RunJob, Stop>;

} // namespace threaded
