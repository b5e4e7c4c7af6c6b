/**
 * @file worker.cpp
 * @brief Worker loop implementation
 */

#include "threaded/core/worker.hpp"

#include <exception>
#include <variant>
#include <utility>

#include <spdlog/spdlog.h>

namespace threaded {

Worker::Worker(WorkerId id, Receiver<Message> receiver, const ThreadPoolConfig& config)
    : id_(id)
    , pool_name_(config.name)
    , log_job_failures_(config.log_job_failures)
    , created_at_(std::chrono::steady_clock::now())
    , receiver_(std::move(receiver)) {
    thread_ = std::thread(&Worker::run, this);
}

Worker::~Worker() {
    join();
}

void Worker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

WorkerStats Worker::stats() const noexcept {
    WorkerStats stats;
    stats.jobs_executed = jobs_executed_.load(std::memory_order_relaxed);
    stats.jobs_failed = jobs_failed_.load(std::memory_order_relaxed);
    stats.stops_received = stops_received_.load(std::memory_order_relaxed);
    stats.busy_time_ns = busy_time_ns_.load(std::memory_order_relaxed);
    return stats;
}

void Worker::run() {
    spdlog::debug("[{}] worker {} started", pool_name_, id_);

    while (true) {
        auto message = receiver_.recv();

        if (!message) {
            // Every sender is gone but this worker never saw its Stop.
            spdlog::critical("[{}] worker {} lost its channel, exiting", pool_name_, id_);
            break;
        }

        if (auto* run_job = std::get_if<RunJob>(&*message)) {
            execute(run_job->job);
            continue;
        }

        stops_received_.fetch_add(1, std::memory_order_relaxed);
        break;
    }

    state_.store(WorkerState::Stopped, std::memory_order_release);
    spdlog::debug("[{}] worker {} stopped after {} jobs ({} failed)",
                  pool_name_, id_, jobs_executed_.load(std::memory_order_relaxed),
                  jobs_failed_.load(std::memory_order_relaxed));
}

void Worker::execute(Job& job) {
    state_.store(WorkerState::Running, std::memory_order_release);
    auto start = std::chrono::steady_clock::now();

    try {
        job();
    } catch (const std::exception& e) {
        jobs_failed_.fetch_add(1, std::memory_order_relaxed);
        if (log_job_failures_) {
            spdlog::error("[{}] worker {}: job failed: {}", pool_name_, id_, e.what());
        }
    } catch (...) {
        jobs_failed_.fetch_add(1, std::memory_order_relaxed);
        if (log_job_failures_) {
            spdlog::error("[{}] worker {}: job failed with a non-standard exception", pool_name_, id_);
        }
    }

    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    busy_time_ns_.fetch_add(static_cast<std::uint64_t>(ns), std::memory_order_relaxed);
    jobs_executed_.fetch_add(1, std::memory_order_relaxed);

    state_.store(WorkerState::Idle, std::memory_order_release);
}

} // namespace threaded
