/**
 * @file parallel_sum.cpp
 * @brief Example: split a sum over a pool of workers
 *
 * Each job adds up one slice of the range and publishes its partial
 * result; tearing the pool down waits for every slice.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <vector>

#include "threaded/threaded.hpp"

int main() {
    constexpr std::uint64_t n = 100000000;
    constexpr std::size_t slices = 64;

    std::cout << "=== threaded Example: Parallel Sum ===" << std::endl;
    std::cout << "Version: " << threaded::VERSION << std::endl;
    std::cout << std::endl;

    threaded::ThreadPoolConfig config;
    config.capacity = threaded::default_capacity();
    config.name = "parallel-sum";

    std::vector<std::uint64_t> partials(slices, 0);
    std::atomic<std::size_t> finished{0};

    auto start = std::chrono::steady_clock::now();
    {
        threaded::ThreadPool pool(config);
        std::cout << "Workers: " << pool.capacity() << std::endl;

        const std::uint64_t step = n / slices;
        for (std::size_t s = 0; s < slices; s++) {
            const std::uint64_t begin = s * step + 1;
            const std::uint64_t end = (s + 1 == slices) ? n : (s + 1) * step;

            pool.submit([&partials, &finished, s, begin, end]() {
                std::uint64_t sum = 0;
                for (std::uint64_t i = begin; i <= end; i++) {
                    sum += i;
                }
                partials[s] = sum;
                finished.fetch_add(1, std::memory_order_relaxed);
            });
        }
    }  // blocks until every slice has run
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start
    );

    std::uint64_t total = 0;
    for (auto partial : partials) {
        total += partial;
    }

    std::cout << "\n=== Result ===" << std::endl;
    std::cout << "Slices finished: " << finished.load() << "/" << slices << std::endl;
    std::cout << "Sum 1.." << n << " = " << total << std::endl;
    std::cout << "Expected: " << n * (n + 1) / 2 << std::endl;
    std::cout << "Elapsed: " << elapsed.count() << " ms" << std::endl;

    return total == n * (n + 1) / 2 ? 0 : 1;
}
