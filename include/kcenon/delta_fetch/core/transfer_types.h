/**
 * @file transfer_types.h
 * @brief Per-file outcomes and the run summary
 */

#ifndef KCENON_DELTA_FETCH_CORE_TRANSFER_TYPES_H
#define KCENON_DELTA_FETCH_CORE_TRANSFER_TYPES_H

#include "kcenon/delta_fetch/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Final outcome of one file in a run
 */
enum class file_outcome {
    committed,   ///< New content fetched and placed at the destination
    skipped,     ///< Destination already up to date, nothing fetched
    failed,      ///< At least one chunk could not be fetched, or a file-level error
    cancelled    ///< Run cancelled before the file finished
};

[[nodiscard]] constexpr auto to_string(file_outcome outcome) -> const char* {
    switch (outcome) {
        case file_outcome::committed: return "committed";
        case file_outcome::skipped: return "skipped";
        case file_outcome::failed: return "failed";
        case file_outcome::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Result record of one file
 */
struct file_report {
    std::string remote_path;
    std::filesystem::path destination;
    file_outcome outcome = file_outcome::skipped;
    uint64_t size = 0;
    uint64_t bytes_fetched = 0;
    std::size_t chunks_total = 0;
    std::size_t chunks_fetched = 0;
    std::size_t chunks_failed = 0;
    std::size_t retries = 0;
    std::size_t replans = 0;
    std::string sha256;
    std::optional<std::filesystem::path> archived_to;
    std::optional<error> failure;
};

/**
 * @brief Summary of a whole run
 */
struct run_summary {
    std::vector<file_report> files;
    std::size_t committed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    uint64_t bytes_fetched = 0;
    std::size_t chunks_fetched = 0;
    bool was_cancelled = false;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    /**
     * @brief Append a file report and update the counters
     */
    void add(file_report report);

    [[nodiscard]] auto total_files() const -> std::size_t { return files.size(); }

    [[nodiscard]] auto succeeded() const -> bool { return failed == 0 && !was_cancelled; }

    /**
     * @brief Process exit status: 0 success, 1 any failure, 130 cancelled
     */
    [[nodiscard]] auto exit_status() const -> int;

    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Write to_json() to path
     */
    [[nodiscard]] auto write_json(const std::filesystem::path& path) const -> result<void>;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_TRANSFER_TYPES_H
