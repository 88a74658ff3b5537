/**
 * @file bench_fetch_throughput.cpp
 * @brief End-to-end fetch throughput from a directory remote
 */

#include <benchmark/benchmark.h>

#include <kcenon/delta_fetch/delta_fetch.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::delta_fetch::benchmark {

namespace {

auto build_coordinator(const scratch_tree& tree, std::size_t workers, std::size_t chunk_size)
    -> result<transfer_coordinator> {
    auto session = std::make_shared<directory_remote_session>(tree.remote_root());

    coordinator_config config;
    config.worker_count = workers;
    config.chunk_size = chunk_size;
    config.sync_writes = false;
    config.write_report = false;
    config.archive = archive_policy::never;

    return transfer_coordinator::builder().with_config(config).build(session);
}

}  // namespace

/**
 * @brief Full fetch of one file; range(0) size, range(1) chunk size, range(2) workers
 */
static void BM_Fetch_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    const auto workers = static_cast<std::size_t>(state.range(2));

    scratch_tree tree("fetch_single");
    tree.add_remote_file("data/file.bin", file_size);

    auto coordinator = build_coordinator(tree, workers, chunk_size);
    if (!coordinator) {
        state.SkipWithError(coordinator.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        state.PauseTiming();
        tree.reset_local();
        state.ResumeTiming();

        auto summary = coordinator.value().run("data", tree.local_root());
        if (!summary || !summary.value().succeeded()) {
            state.SkipWithError("Fetch failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size));
}

/**
 * @brief Rerun over an unchanged tree of many small files
 */
static void BM_Fetch_UnchangedTree(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));

    scratch_tree tree("fetch_unchanged");
    for (std::size_t i = 0; i < file_count; ++i) {
        tree.add_remote_file("data/dir" + std::to_string(i % 10) + "/f" + std::to_string(i),
                             4 * sizes::KB, static_cast<uint32_t>(i + 1));
    }

    auto coordinator = build_coordinator(tree, 4, sizes::min_chunk);
    if (!coordinator) {
        state.SkipWithError(coordinator.error().message.c_str());
        return;
    }
    auto first = coordinator.value().run("data", tree.local_root());
    if (!first || !first.value().succeeded()) {
        state.SkipWithError("Initial fetch failed");
        return;
    }

    for (auto _ : state) {
        auto summary = coordinator.value().run("data", tree.local_root());
        ::benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Fetch_SingleFile)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk), 4})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk), 8})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk), 8})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Fetch_UnchangedTree)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::delta_fetch::benchmark
