/**
 * @file fetch_config.h
 * @brief Configuration for the delta fetch engine
 */

#ifndef KCENON_DELTA_FETCH_CORE_FETCH_CONFIG_H
#define KCENON_DELTA_FETCH_CORE_FETCH_CONFIG_H

#include "kcenon/delta_fetch/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::delta_fetch {

/**
 * @brief Retry policy for transient chunk fetch failures
 *
 * max_attempts counts every attempt, the first one included. The delay
 * before attempt n+1 is base_delay * backoff_multiplier^(n-1), capped at
 * max_delay.
 */
struct retry_policy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay to wait after the given failed attempt
     * @param failed_attempt 1-based attempt number that just failed
     */
    [[nodiscard]] auto delay_after(std::size_t failed_attempt) const -> std::chrono::milliseconds {
        if (failed_attempt == 0) {
            return std::chrono::milliseconds{0};
        }
        double delay = static_cast<double>(base_delay.count());
        for (std::size_t i = 1; i < failed_attempt; ++i) {
            delay *= backoff_multiplier;
            if (delay >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        auto ms = std::chrono::milliseconds{static_cast<int64_t>(delay)};
        return ms < max_delay ? ms : max_delay;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_attempts == 0) {
            return unexpected(error{error_code::invalid_retry_policy,
                                    "max_attempts must be at least 1"});
        }
        if (base_delay.count() < 0 || max_delay < base_delay) {
            return unexpected(error{error_code::invalid_retry_policy,
                                    "delays must satisfy 0 <= base_delay <= max_delay"});
        }
        if (backoff_multiplier < 1.0) {
            return unexpected(error{error_code::invalid_retry_policy,
                                    "backoff_multiplier must be >= 1.0"});
        }
        return {};
    }
};

/**
 * @brief When the previous local version is moved into history
 */
enum class archive_policy {
    if_changed,  ///< Only when the content differs from the incoming version
    always,      ///< Whenever a destination is replaced
    never        ///< Overwrite without keeping history
};

[[nodiscard]] constexpr auto to_string(archive_policy policy) -> const char* {
    switch (policy) {
        case archive_policy::if_changed: return "if-changed";
        case archive_policy::always: return "always";
        case archive_policy::never: return "never";
        default: return "unknown";
    }
}

/**
 * @brief Parse an archive policy name ("if-changed", "always", "never")
 */
[[nodiscard]] inline auto parse_archive_policy(std::string_view name) -> result<archive_policy> {
    if (name == "if-changed" || name == "if_changed") return archive_policy::if_changed;
    if (name == "always") return archive_policy::always;
    if (name == "never") return archive_policy::never;
    return unexpected(error{error_code::invalid_configuration,
                            "unknown archive policy: " + std::string(name)});
}

/**
 * @brief Configuration passed to the transfer coordinator
 *
 * Empty state_directory and history_directory resolve relative to the local
 * root of a run: `<root>/.delta_fetch/state` and `<root>/.versions`.
 */
struct coordinator_config {
    /// Default chunk size (1MB)
    static constexpr std::size_t default_chunk_size = 1024 * 1024;

    /// Minimum allowed chunk size (4KB)
    static constexpr std::size_t min_chunk_size = 4 * 1024;

    /// Maximum allowed chunk size (64MB)
    static constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

    static constexpr std::size_t default_worker_count = 4;
    static constexpr std::size_t max_worker_count = 64;

    std::size_t worker_count = default_worker_count;
    std::size_t chunk_size = default_chunk_size;
    retry_policy retry;

    std::filesystem::path state_directory;
    std::filesystem::path history_directory;
    archive_policy archive = archive_policy::if_changed;

    bool sync_writes = true;            ///< fsync checkpoint records and staging files
    std::size_t max_replans = 1;        ///< Replans allowed after a mid-transfer change
    bool write_report = true;
    std::string report_filename = "fetch_report.json";
    std::chrono::seconds checkpoint_ttl{7 * 24 * 3600};

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (worker_count == 0 || worker_count > max_worker_count) {
            return unexpected(error{
                error_code::invalid_worker_count,
                "worker count must be between 1 and " + std::to_string(max_worker_count)});
        }
        return retry.validate();
    }

    /**
     * @brief Calculate number of chunks for a given file size
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_FETCH_CONFIG_H
