/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for threaded
 */

#include <benchmark/benchmark.h>

#include <atomic>
#include <cstdint>

#include "threaded/threaded.hpp"

using namespace threaded;

static void BM_ChannelSendRecv(benchmark::State& state) {
    auto [tx, rx] = make_channel<std::int64_t>();

    for (auto _ : state) {
        bool sent = tx.send(std::int64_t{42});
        auto result = rx.recv();
        benchmark::DoNotOptimize(sent);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ChannelSendRecv);

static void BM_ChannelTryRecvEmpty(benchmark::State& state) {
    auto [tx, rx] = make_channel<std::int64_t>();

    for (auto _ : state) {
        auto result = rx.try_recv();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ChannelTryRecvEmpty);

static void BM_JobCreation(benchmark::State& state) {
    std::int64_t counter = 0;

    for (auto _ : state) {
        Job job([&counter]() { counter++; });
        benchmark::DoNotOptimize(job);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_JobCreation);

static void BM_JobInvoke(benchmark::State& state) {
    std::int64_t counter = 0;

    for (auto _ : state) {
        Job job([&counter]() { counter++; });
        job();
    }

    benchmark::DoNotOptimize(counter);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_JobInvoke);

static void BM_PoolSubmitAndDrain(benchmark::State& state) {
    const auto num_workers = static_cast<std::size_t>(state.range(0));
    constexpr int jobs_per_iteration = 10000;
    set_log_level(spdlog::level::warn);

    for (auto _ : state) {
        std::atomic<std::int64_t> completed{0};
        {
            ThreadPool pool(num_workers);
            for (int i = 0; i < jobs_per_iteration; i++) {
                pool.submit([&completed]() {
                    completed.fetch_add(1, std::memory_order_relaxed);
                });
            }
        }
        auto total = completed.load();
        benchmark::DoNotOptimize(total);
    }

    state.SetItemsProcessed(state.iterations() * jobs_per_iteration);
}
BENCHMARK(BM_PoolSubmitAndDrain)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

BENCHMARK_MAIN();
