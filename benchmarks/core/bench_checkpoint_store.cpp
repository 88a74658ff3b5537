/**
 * @file bench_checkpoint_store.cpp
 * @brief Benchmarks for durable checkpoint commits
 */

#include <benchmark/benchmark.h>

#include <kcenon/delta_fetch/core/checkpoint_store.h>

#include "utils/benchmark_helpers.h"

#include <thread>
#include <vector>

namespace kcenon::delta_fetch::benchmark {

/**
 * @brief Commit every chunk of one destination; range(0) chunks, range(1) fsync
 */
static void BM_CheckpointStore_Commit(::benchmark::State& state) {
    const auto chunks = static_cast<uint64_t>(state.range(0));
    const bool sync = state.range(1) != 0;
    constexpr uint64_t chunk_size = sizes::default_chunk;

    scratch_tree tree("checkpoint_commit");
    checkpoint_store_config config(tree.base() / "state");
    config.sync_on_commit = sync;
    checkpoint_store store(config);
    const std::filesystem::path destination = tree.local_root() / "file.bin";

    for (auto _ : state) {
        state.PauseTiming();
        if (!store.begin(destination, "fp", chunks * chunk_size, chunk_size)) {
            state.SkipWithError("begin failed");
            return;
        }
        state.ResumeTiming();

        for (uint64_t i = 0; i < chunks; ++i) {
            if (!store.commit(destination, i * chunk_size)) {
                state.SkipWithError("commit failed");
                return;
            }
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(chunks) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Commits to independent destinations from several threads
 */
static void BM_CheckpointStore_ParallelDestinations(::benchmark::State& state) {
    const auto threads = static_cast<std::size_t>(state.range(0));
    constexpr uint64_t chunks = 32;
    constexpr uint64_t chunk_size = sizes::min_chunk;

    scratch_tree tree("checkpoint_parallel");
    checkpoint_store_config config(tree.base() / "state");
    config.sync_on_commit = false;
    checkpoint_store store(config);

    for (auto _ : state) {
        state.PauseTiming();
        for (std::size_t t = 0; t < threads; ++t) {
            auto destination = tree.local_root() / ("file" + std::to_string(t));
            if (!store.begin(destination, "fp", chunks * chunk_size, chunk_size)) {
                state.SkipWithError("begin failed");
                return;
            }
        }
        state.ResumeTiming();

        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            workers.emplace_back([&, t] {
                auto destination = tree.local_root() / ("file" + std::to_string(t));
                for (uint64_t i = 0; i < chunks; ++i) {
                    ::benchmark::DoNotOptimize(store.commit(destination, i * chunk_size));
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(threads * chunks) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_CheckpointStore_Commit)
    ->Args({64, 0})
    ->Args({64, 1})
    ->Args({512, 0})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_CheckpointStore_ParallelDestinations)
    ->Arg(1)
    ->Arg(4)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::delta_fetch::benchmark
