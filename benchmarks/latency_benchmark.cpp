/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for threaded
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <future>
#include <memory>

#include "threaded/threaded.hpp"

using namespace threaded;

static void BM_SubmitToCompletionLatency(benchmark::State& state) {
    const auto num_workers = static_cast<std::size_t>(state.range(0));
    set_log_level(spdlog::level::warn);
    ThreadPool pool(num_workers);

    for (auto _ : state) {
        std::promise<void> done;
        auto future = done.get_future();

        auto start = std::chrono::high_resolution_clock::now();
        pool.submit([&done]() { done.set_value(); });
        future.wait();
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e9);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SubmitToCompletionLatency)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

static void BM_PoolStartupShutdown(benchmark::State& state) {
    const auto num_workers = static_cast<std::size_t>(state.range(0));
    set_log_level(spdlog::level::warn);

    for (auto _ : state) {
        ThreadPool pool(num_workers);
        auto capacity = pool.capacity();
        benchmark::DoNotOptimize(capacity);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PoolStartupShutdown)->Arg(1)->Arg(4)->Arg(16);

static void BM_TeardownDrainLatency(benchmark::State& state) {
    const auto queued = static_cast<int>(state.range(0));
    set_log_level(spdlog::level::warn);

    for (auto _ : state) {
        state.PauseTiming();
        auto pool = std::make_unique<ThreadPool>(2);
        for (int i = 0; i < queued; i++) {
            pool->submit([]() {});
        }
        state.ResumeTiming();

        // Teardown blocks until the queue is empty
        pool.reset();
    }

    state.SetItemsProcessed(state.iterations() * queued);
}
BENCHMARK(BM_TeardownDrainLatency)->Arg(0)->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
