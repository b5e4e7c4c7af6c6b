#pragma once

/**
 * @file thread_pool.hpp
 * @brief Fixed-capacity pool of worker threads fed by one shared channel
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "threaded/core/channel.hpp"
#include "threaded/core/config.hpp"
#include "threaded/core/error.hpp"
#include "threaded/core/job.hpp"
#include "threaded/core/message.hpp"
#include "threaded/core/worker.hpp"

namespace threaded {

/**
 * @brief Pool of worker threads awaiting jobs
 *
 * Workers are spawned in the constructor and live until shutdown(), which
 * the destructor calls. Shutdown sends one Stop per worker behind every
 * job already queued, then joins the workers in creation order, so it
 * returns only after all submitted work has run.
 *
 * Example:
 * @code
 *   std::atomic<bool> done{false};
 *   {
 *       threaded::ThreadPool pool(2);
 *       pool.submit([&done] { done = true; });
 *   }  // blocks until the job has run
 * @endcode
 */
class ThreadPool {
public:
    /**
     * @brief Create a pool with the given number of workers
     * @throws std::invalid_argument if capacity is zero
     */
    explicit ThreadPool(std::size_t capacity);

    /**
     * @brief Create a pool from a full configuration
     * @throws std::invalid_argument if config.capacity is zero
     */
    explicit ThreadPool(ThreadPoolConfig config);

    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a job for execution on the first idle worker
     * @throws std::invalid_argument if the job is empty
     * @throws PoolShutdownError if the pool has been shut down
     */
    void submit(Job job);

    template<typename Func,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Func>, Job>>>
    void submit(Func&& func) {
        submit(Job(std::forward<Func>(func)));
    }

    /**
     * @brief Same as submit()
     */
    template<typename Func>
    void execute(Func&& func) {
        submit(std::forward<Func>(func));
    }

    /**
     * @brief Stop every worker after the queued jobs and wait for them
     *
     * Only the first call does anything.
     */
    void shutdown();

    /**
     * @brief Change the number of workers
     *
     * Dynamic resizing is not supported. Requesting the current capacity
     * is accepted and does nothing.
     *
     * @throws std::invalid_argument if capacity is zero
     * @throws UnsupportedOperation for any other capacity
     */
    void resize(std::size_t capacity);

    /**
     * @brief Number of workers owned by the pool
     */
    [[nodiscard]] std::size_t capacity() const noexcept { return workers_.size(); }

    [[nodiscard]] bool is_shutdown() const noexcept {
        return shutdown_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ThreadPoolConfig& config() const noexcept { return config_; }

private:
    void stop_workers();

    ThreadPoolConfig config_;
    Sender<Message> sender_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool> shutdown_{false};
    std::atomic<std::uint64_t> submitted_{0};
};

} // namespace threaded
