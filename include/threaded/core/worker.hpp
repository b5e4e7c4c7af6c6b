#pragma once

/**
 * @file worker.hpp
 * @brief Worker thread consuming control messages from the pool's channel
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "threaded/core/channel.hpp"
#include "threaded/core/config.hpp"
#include "threaded/core/message.hpp"

namespace threaded {

/**
 * @brief Identifier of a worker within its pool, used only in diagnostics
 */
using WorkerId = std::uint32_t;

/**
 * @brief Worker lifecycle state
 */
enum class WorkerState {
    Idle,
    Running,
    Stopped
};

/**
 * @brief Snapshot of a worker's counters
 */
struct WorkerStats {
    std::uint64_t jobs_executed{0};
    std::uint64_t jobs_failed{0};
    std::uint64_t stops_received{0};
    std::uint64_t busy_time_ns{0};
};

/**
 * @brief Individual worker thread
 *
 * The thread starts in the constructor and loops on the channel until it
 * receives a Stop message. Exceptions escaping a job are logged and
 * counted; they never end the loop.
 */
class Worker {
public:
    Worker(WorkerId id, Receiver<Message> receiver, const ThreadPoolConfig& config);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Wait for the worker thread to finish
     *
     * Joins the thread the first time it is called; later calls return
     * immediately.
     */
    void join();

    [[nodiscard]] WorkerId id() const noexcept { return id_; }
    [[nodiscard]] std::chrono::steady_clock::time_point created_at() const noexcept { return created_at_; }

    /**
     * @brief Current counters; safe to call while the worker is running
     */
    [[nodiscard]] WorkerStats stats() const noexcept;

    [[nodiscard]] WorkerState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool joinable() const noexcept { return thread_.joinable(); }

private:
    void run();
    void execute(Job& job);

    WorkerId id_;
    std::string pool_name_;
    bool log_job_failures_;
    std::chrono::steady_clock::time_point created_at_;
    Receiver<Message> receiver_;
    std::atomic<WorkerState> state_{WorkerState::Idle};
    std::atomic<std::uint64_t> jobs_executed_{0};
    std::atomic<std::uint64_t> jobs_failed_{0};
    std::atomic<std::uint64_t> stops_received_{0};
    std::atomic<std::uint64_t> busy_time_ns_{0};
    std::thread thread_;
};

} // namespace threaded
