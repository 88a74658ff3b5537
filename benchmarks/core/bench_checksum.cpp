/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for content hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/delta_fetch/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <span>

namespace kcenon::delta_fetch::benchmark {

static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Chunk-by-chunk hashing as done while verifying a staged file
 */
static void BM_Checksum_SHA256_Incremental(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(sizes::medium_file, 42);

    for (auto _ : state) {
        sha256_hasher hasher;
        for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
            auto length = std::min(chunk_size, data.size() - offset);
            hasher.update(std::span<const std::byte>(data.data() + offset, length));
        }
        ::benchmark::DoNotOptimize(hasher.finish());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data.size()) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_SHA256_File(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));

    scratch_tree tree("sha256_file");
    auto path = tree.add_remote_file("hash.bin", size);

    for (auto _ : state) {
        auto digest = checksum::sha256_file(path);
        if (!digest) {
            state.SkipWithError("Failed to calculate file hash");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256_Incremental)
    ->Arg(static_cast<int64_t>(sizes::min_chunk))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_SHA256_File)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::delta_fetch::benchmark
