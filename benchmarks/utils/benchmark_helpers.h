/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_DELTA_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_DELTA_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::delta_fetch::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch directory that is removed on destruction
 *
 * Doubles as a remote tree for directory_remote_session: files are created
 * under remote_root() and runs write into local_root().
 */
class scratch_tree {
public:
    explicit scratch_tree(const std::string& name);
    ~scratch_tree();

    scratch_tree(const scratch_tree&) = delete;
    auto operator=(const scratch_tree&) -> scratch_tree& = delete;

    /**
     * @brief Create a remote file with random content
     * @param relative Path under remote_root()
     */
    auto add_remote_file(const std::filesystem::path& relative, std::size_t size,
                         uint32_t seed = 42) -> std::filesystem::path;

    /**
     * @brief Remove the local tree so the next run starts from scratch
     */
    void reset_local();

    [[nodiscard]] auto base() const -> const std::filesystem::path& { return base_; }
    [[nodiscard]] auto remote_root() const -> std::filesystem::path { return base_ / "remote"; }
    [[nodiscard]] auto local_root() const -> std::filesystem::path { return base_ / "local"; }

private:
    std::filesystem::path base_;
};

/**
 * @brief Format bytes as human-readable string (e.g. "1.50 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 64 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 1 * MB;
constexpr std::size_t max_chunk = 4 * MB;
}  // namespace sizes

}  // namespace kcenon::delta_fetch::benchmark

#endif  // KCENON_DELTA_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H
