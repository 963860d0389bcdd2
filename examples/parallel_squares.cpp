/**
 * @file parallel_squares.cpp
 * @brief Example: spread a CPU-bound function over a pool and drain it
 */

#include <chrono>
#include <cstdint>
#include <iostream>

#include "isoworker/isoworker.hpp"

namespace {

// Deliberately slow: sums i*i over [0, n)
std::uint64_t sum_of_squares(std::uint64_t n) {
    std::uint64_t total = 0;
    for (std::uint64_t i = 0; i < n; i++) {
        total += i * i;
    }
    return total;
}

} // namespace

int main() {
    std::cout << "=== isoworker Example Pool ===" << std::endl;
    std::cout << "Version: " << isoworker::VERSION << std::endl;
    std::cout << std::endl;

    isoworker::PoolConfig config;
    config.worker_count = 4;
    config.name = "squares";

    isoworker::Pool<std::uint64_t, std::uint64_t> pool(sum_of_squares, config);

    auto start_time = std::chrono::steady_clock::now();
    pool.start().get();

    constexpr std::uint64_t jobs = 32;
    for (std::uint64_t i = 0; i < jobs; i++) {
        pool.send(1000000 + i);
    }

    // Every queued job completes before the workers terminate
    pool.shutdown();

    std::uint64_t received = 0;
    std::uint64_t checksum = 0;
    for (auto value : pool.output_stream()) {
        checksum ^= value;
        received++;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    std::cout << "Workers:  " << pool.worker_count() << std::endl;
    std::cout << "Results:  " << received << " / " << jobs << std::endl;
    std::cout << "Checksum: " << checksum << std::endl;
    std::cout << "Elapsed:  " << elapsed.count() << " ms" << std::endl;

    return received == jobs ? 0 : 1;
}
