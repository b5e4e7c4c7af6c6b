#pragma once

/**
 * @file error.hpp
 * @brief Exception types raised by the thread pool
 */

#include <stdexcept>
#include <string>

namespace threaded {

/**
 * @brief Base class for all thread pool failures
 */
class ThreadPoolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when work is submitted to a pool that has been torn down
 */
class PoolShutdownError : public ThreadPoolError {
public:
    explicit PoolShutdownError(const std::string& pool_name)
        : ThreadPoolError("thread pool '" + pool_name + "' is shut down") {}
};

/**
 * @brief Raised for operations the pool declares but does not support
 */
class UnsupportedOperation : public ThreadPoolError {
public:
    using ThreadPoolError::ThreadPoolError;
};

/**
 * @brief Raised when an empty or already consumed job is invoked
 */
class EmptyJobError : public ThreadPoolError {
public:
    EmptyJobError()
        : ThreadPoolError("job is empty or has already run") {}
};

} // namespace threaded
