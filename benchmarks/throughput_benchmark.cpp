/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for isoworker
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <vector>

#include "isoworker/isoworker.hpp"

using namespace isoworker;

static void BM_ChannelPushPop(benchmark::State& state) {
    Channel<std::int64_t> channel;

    for (auto _ : state) {
        channel.push(42);
        auto result = channel.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ChannelPushPop);

static void BM_ChannelTryPop(benchmark::State& state) {
    Channel<std::int64_t> channel;

    for (auto _ : state) {
        channel.push(42);
        auto result = channel.try_pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ChannelTryPop);

static void BM_ComputationCall(benchmark::State& state) {
    Computation<std::int64_t, std::int64_t> square([](std::int64_t x) { return x * x; });

    std::int64_t i = 0;
    for (auto _ : state) {
        auto completion = square(i++);
        benchmark::DoNotOptimize(completion);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComputationCall);

// Full round trip through one worker: start, send N, drain, shutdown
static void BM_WorkerRoundTrip(benchmark::State& state) {
    const auto count = static_cast<std::int64_t>(state.range(0));

    for (auto _ : state) {
        Worker<std::int64_t, std::int64_t> worker([](std::int64_t x) { return x * x; });
        worker.start().get();

        for (std::int64_t i = 0; i < count; i++) {
            worker.send(i);
        }
        worker.shutdown();

        std::int64_t sum = 0;
        for (auto value : worker.output_stream()) {
            sum += value;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_WorkerRoundTrip)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

// Same load spread across a pool of range(1) workers
static void BM_PoolRoundTrip(benchmark::State& state) {
    const auto count = static_cast<std::int64_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    for (auto _ : state) {
        Pool<std::int64_t, std::int64_t> pool([](std::int64_t x) { return x * x; }, workers);
        pool.start().get();

        for (std::int64_t i = 0; i < count; i++) {
            pool.send(i);
        }
        pool.shutdown();

        std::int64_t sum = 0;
        for (auto value : pool.output_stream()) {
            sum += value;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_PoolRoundTrip)
    ->Args({10000, 1})
    ->Args({10000, 4})
    ->Args({10000, 8})
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
