/**
 * @file bench_chunk_planner.cpp
 * @brief Benchmarks for chunk planning with and without a prior checkpoint
 */

#include <benchmark/benchmark.h>

#include <kcenon/delta_fetch/core/chunk_planner.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::delta_fetch::benchmark {

namespace {

auto make_item(uint64_t size) -> remote_item {
    remote_item item;
    item.path = "bench/file.bin";
    item.name = "file.bin";
    item.size = size;
    item.modified = std::chrono::system_clock::time_point{std::chrono::milliseconds{1700000000000}};
    return item;
}

}  // namespace

static void BM_ChunkPlanner_Fresh(::benchmark::State& state) {
    const auto file_size = static_cast<uint64_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    chunk_planner planner(chunk_size);
    auto item = make_item(file_size);

    for (auto _ : state) {
        auto plan = planner.plan(item);
        if (!plan) {
            state.SkipWithError("Failed to plan");
            return;
        }
        ::benchmark::DoNotOptimize(plan.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(planner.chunk_count(file_size)) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Resume planning against a checkpoint with every other chunk committed
 */
static void BM_ChunkPlanner_Resume(::benchmark::State& state) {
    const auto file_size = static_cast<uint64_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    chunk_planner planner(chunk_size);
    auto item = make_item(file_size);

    checkpoint prior;
    prior.destination = "/tmp/file.bin";
    prior.fingerprint = item.fingerprint().to_string();
    prior.file_size = file_size;
    prior.chunk_size = chunk_size;
    for (uint64_t offset = 0; offset < file_size; offset += 2 * chunk_size) {
        prior.committed_offsets.insert(offset);
    }

    for (auto _ : state) {
        auto plan = planner.plan(item, prior);
        if (!plan) {
            state.SkipWithError("Failed to plan");
            return;
        }
        ::benchmark::DoNotOptimize(plan.value().pending_count());
    }

    state.SetItemsProcessed(static_cast<int64_t>(planner.chunk_count(file_size)) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkPlanner_Fresh)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({int64_t{16} * 1024 * 1024 * 1024, static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunkPlanner_Resume)
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({int64_t{16} * 1024 * 1024 * 1024, static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::delta_fetch::benchmark
