/**
 * @file thread_pool.cpp
 * @brief Thread pool implementation
 */

#include "threaded/core/thread_pool.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace threaded {

ThreadPool::ThreadPool(std::size_t capacity)
    : ThreadPool(ThreadPoolConfig{capacity}) {}

ThreadPool::ThreadPool(ThreadPoolConfig config)
    : config_(std::move(config)) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("Thread pool capacity must be positive");
    }

    auto channel = make_channel<Message>();
    sender_ = std::move(channel.first);

    workers_.reserve(config_.capacity);
    try {
        for (std::size_t i = 0; i < config_.capacity; i++) {
            workers_.push_back(std::make_unique<Worker>(
                static_cast<WorkerId>(i), channel.second, config_
            ));
        }
    } catch (...) {
        // Workers already running would block forever in the destructor.
        stop_workers();
        throw;
    }

    spdlog::info("[{}] thread pool started with {} workers", config_.name, workers_.size());
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::submit(Job job) {
    if (job.empty()) {
        throw std::invalid_argument("Job cannot be empty");
    }

    if (is_shutdown()) {
        throw PoolShutdownError(config_.name);
    }

    if (!sender_.send(RunJob{std::move(job)})) {
        throw PoolShutdownError(config_.name);
    }

    submitted_.fetch_add(1, std::memory_order_relaxed);
}

void ThreadPool::shutdown() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    stop_workers();

    std::uint64_t executed = 0;
    std::uint64_t failed = 0;
    for (const auto& worker : workers_) {
        executed += worker->stats().jobs_executed;
        failed += worker->stats().jobs_failed;
    }

    spdlog::info("[{}] thread pool drained: {} submitted, {} executed, {} failed",
                 config_.name, submitted_.load(std::memory_order_relaxed), executed, failed);
}

void ThreadPool::resize(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("Thread pool capacity must be positive");
    }

    if (capacity == workers_.size()) {
        return;
    }

    throw UnsupportedOperation("Thread pool cannot be resized from " +
                               std::to_string(workers_.size()) + " to " +
                               std::to_string(capacity) + " workers");
}

void ThreadPool::stop_workers() {
    // Stops go behind every accepted job and the channel closes with them,
    // so a submit racing shutdown either runs or throws.
    if (!sender_.close_with(workers_.size(), [] { return Message{Stop{}}; })) {
        spdlog::critical("[{}] channel disconnected while stopping workers", config_.name);
    }

    for (auto& worker : workers_) {
        worker->join();
    }
}

} // namespace threaded
