#pragma once

/**
 * @file job.hpp
 * @brief Type-erased, single-shot unit of work
 */

#include <memory>
#include <type_traits>
#include <utility>

#include "threaded/core/error.hpp"

namespace threaded {

/**
 * @brief Interface implemented by every stored callable
 */
class JobBase {
public:
    virtual ~JobBase() = default;

    /**
     * @brief Run the stored callable
     */
    virtual void run() = 0;
};

/**
 * @brief Job implementation wrapping an arbitrary callable
 */
template<typename Func>
class FunctionJob final : public JobBase {
public:
    explicit FunctionJob(Func func)
        : func_(std::move(func)) {}

    void run() override {
        func_();
    }

private:
    Func func_;
};

/**
 * @brief A zero-argument, zero-result callable that runs at most once
 *
 * Jobs are move-only. They accept move-only callables (for example a
 * lambda capturing a std::unique_ptr), which std::function cannot hold.
 * Invoking a job consumes it: the callable is destroyed right after it
 * returns and the job becomes empty.
 */
class Job {
public:
    Job() = default;

    template<typename Func,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Func>, Job>>,
             typename = std::enable_if_t<std::is_invocable_v<std::decay_t<Func>&>>>
    Job(Func&& func)  // NOLINT(google-explicit-constructor)
        : impl_(std::make_unique<FunctionJob<std::decay_t<Func>>>(std::forward<Func>(func))) {}

    Job(Job&&) noexcept = default;
    Job& operator=(Job&&) noexcept = default;

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    /**
     * @brief Run the job and release its callable
     * @throws EmptyJobError if the job is empty or has already run
     */
    void operator()() {
        if (!impl_) {
            throw EmptyJobError();
        }
        auto impl = std::move(impl_);
        impl->run();
    }

    [[nodiscard]] bool empty() const noexcept { return impl_ == nullptr; }

    explicit operator bool() const noexcept { return impl_ != nullptr; }

private:
    std::unique_ptr<JobBase> impl_;
};

/**
 * @brief Factory function for creating jobs
 */
template<typename Func>
Job make_job(Func&& func) {
    return Job(std::forward<Func>(func));
}

} // namespace threaded
