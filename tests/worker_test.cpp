/**
 * @file worker_test.cpp
 * @brief Unit tests for the worker loop
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "threaded/core/worker.hpp"

using namespace threaded;

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        config_.capacity = 1;
        config_.name = "worker-test";
    }

    void TearDown() override {
        spdlog::set_level(spdlog::level::info);
    }

    ThreadPoolConfig config_;
};

TEST_F(WorkerTest, RunsJobsUntilStop) {
    auto [tx, rx] = make_channel<Message>();
    std::atomic<int> counter{0};

    Worker worker(7, rx, config_);
    EXPECT_EQ(worker.id(), 7u);
    EXPECT_LE(worker.created_at(), std::chrono::steady_clock::now());

    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(tx.send(RunJob{Job([&counter]() { counter++; })}));
    }
    ASSERT_TRUE(tx.send(Stop{}));

    worker.join();

    EXPECT_EQ(counter.load(), 3);
    EXPECT_EQ(worker.state(), WorkerState::Stopped);
    EXPECT_EQ(worker.stats().jobs_executed, 3u);
    EXPECT_EQ(worker.stats().jobs_failed, 0u);
    EXPECT_EQ(worker.stats().stops_received, 1u);
}

TEST_F(WorkerTest, RunsJobsInQueueOrder) {
    auto [tx, rx] = make_channel<Message>();
    std::vector<int> order;

    Worker worker(0, rx, config_);
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(tx.send(RunJob{Job([i, &order]() { order.push_back(i); })}));
    }
    ASSERT_TRUE(tx.send(Stop{}));
    worker.join();

    ASSERT_EQ(order.size(), 5u);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }
}

TEST_F(WorkerTest, SurvivesFailingJob) {
    auto [tx, rx] = make_channel<Message>();
    std::atomic<bool> after_failure{false};

    Worker worker(0, rx, config_);
    ASSERT_TRUE(tx.send(RunJob{Job([]() { throw std::runtime_error("job failed"); })}));
    ASSERT_TRUE(tx.send(RunJob{Job([]() { throw 42; })}));
    ASSERT_TRUE(tx.send(RunJob{Job([&after_failure]() { after_failure = true; })}));
    ASSERT_TRUE(tx.send(Stop{}));
    worker.join();

    EXPECT_TRUE(after_failure.load());
    EXPECT_EQ(worker.stats().jobs_executed, 3u);
    EXPECT_EQ(worker.stats().jobs_failed, 2u);
}

TEST_F(WorkerTest, ExitsWhenChannelDisconnected) {
    auto channel = make_channel<Message>();
    auto tx = std::make_unique<Sender<Message>>(std::move(channel.first));

    Worker worker(0, channel.second, config_);
    tx.reset();
    worker.join();

    EXPECT_EQ(worker.state(), WorkerState::Stopped);
    EXPECT_EQ(worker.stats().stops_received, 0u);
}

TEST_F(WorkerTest, StatsReadableWhileRunning) {
    auto [tx, rx] = make_channel<Message>();
    std::promise<void> started;
    std::promise<void> release;
    auto release_future = release.get_future().share();

    Worker worker(0, rx, config_);
    ASSERT_TRUE(tx.send(RunJob{Job([]() {})}));
    ASSERT_TRUE(tx.send(RunJob{Job([&started, release_future]() {
        started.set_value();
        release_future.wait();
    })}));

    started.get_future().wait();
    auto during = worker.stats();
    EXPECT_EQ(during.jobs_executed, 1u);
    EXPECT_EQ(worker.state(), WorkerState::Running);

    release.set_value();
    ASSERT_TRUE(tx.send(Stop{}));
    worker.join();

    auto after = worker.stats();
    EXPECT_EQ(after.jobs_executed, 2u);
    EXPECT_EQ(after.stops_received, 1u);
}

TEST_F(WorkerTest, JoinIsIdempotent) {
    auto [tx, rx] = make_channel<Message>();

    Worker worker(0, rx, config_);
    EXPECT_TRUE(worker.joinable());
    ASSERT_TRUE(tx.send(Stop{}));

    worker.join();
    EXPECT_FALSE(worker.joinable());
    EXPECT_NO_THROW(worker.join());
}

TEST_F(WorkerTest, StopsAreSharedAcrossWorkers) {
    auto [tx, rx] = make_channel<Message>();
    std::atomic<int> counter{0};

    std::vector<std::unique_ptr<Worker>> workers;
    for (WorkerId id = 0; id < 3; id++) {
        workers.push_back(std::make_unique<Worker>(id, rx, config_));
    }

    for (int i = 0; i < 30; i++) {
        ASSERT_TRUE(tx.send(RunJob{Job([&counter]() {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            counter++;
        })}));
    }
    for (std::size_t i = 0; i < workers.size(); i++) {
        ASSERT_TRUE(tx.send(Stop{}));
    }

    std::uint64_t executed = 0;
    std::uint64_t stops = 0;
    for (auto& worker : workers) {
        worker->join();
        executed += worker->stats().jobs_executed;
        stops += worker->stats().stops_received;
    }

    EXPECT_EQ(counter.load(), 30);
    EXPECT_EQ(executed, 30u);
    EXPECT_EQ(stops, 3u);
}
