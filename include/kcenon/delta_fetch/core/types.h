/**
 * @file types.h
 * @brief Core type definitions for delta_fetch
 */

#ifndef KCENON_DELTA_FETCH_CORE_TYPES_H
#define KCENON_DELTA_FETCH_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::delta_fetch {

/**
 * @brief Error codes for delta fetch operations
 */
enum class error_code {
    success = 0,

    // Remote transport errors (-100 to -119)
    connection_failed = -100,
    connection_timeout = -101,
    connection_lost = -102,
    remote_unavailable = -103,
    remote_throttled = -104,
    remote_short_read = -105,
    auth_failed = -110,
    auth_required = -111,

    // Remote item errors (-120 to -139)
    remote_not_found = -120,
    remote_access_denied = -121,
    remote_content_changed = -122,
    invalid_range = -123,
    invalid_remote_item = -124,
    content_hash_mismatch = -125,

    // Local storage errors (-140 to -159)
    storage_error = -140,
    disk_full = -141,
    file_write_error = -142,
    file_read_error = -143,
    file_not_found = -144,
    directory_create_failed = -145,
    file_rename_failed = -146,
    archive_failed = -147,

    // Checkpoint errors (-160 to -179)
    checkpoint_not_found = -160,
    checkpoint_corrupted = -161,
    checkpoint_write_failed = -162,
    invalid_chunk_offset = -163,
    missing_chunks = -164,

    // Configuration errors (-180 to -199)
    invalid_chunk_size = -180,
    invalid_worker_count = -181,
    invalid_retry_policy = -182,
    invalid_configuration = -183,
    profile_not_found = -184,
    profile_parse_error = -185,

    // Run errors (-200 to -219)
    internal_error = -200,
    cancelled = -201,
    not_initialized = -202,
    retries_exhausted = -203,
    pool_stopped = -204,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::remote_unavailable:
            return "remote unavailable";
        case error_code::remote_throttled:
            return "remote throttled";
        case error_code::remote_short_read:
            return "remote short read";
        case error_code::auth_failed:
            return "authentication failed";
        case error_code::auth_required:
            return "authentication required";
        case error_code::remote_not_found:
            return "remote item not found";
        case error_code::remote_access_denied:
            return "remote access denied";
        case error_code::remote_content_changed:
            return "remote content changed";
        case error_code::invalid_range:
            return "invalid range";
        case error_code::invalid_remote_item:
            return "invalid remote item";
        case error_code::content_hash_mismatch:
            return "content hash mismatch";
        case error_code::storage_error:
            return "storage error";
        case error_code::disk_full:
            return "disk full";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::directory_create_failed:
            return "directory create failed";
        case error_code::file_rename_failed:
            return "file rename failed";
        case error_code::archive_failed:
            return "archive failed";
        case error_code::checkpoint_not_found:
            return "checkpoint not found";
        case error_code::checkpoint_corrupted:
            return "checkpoint corrupted";
        case error_code::checkpoint_write_failed:
            return "checkpoint write failed";
        case error_code::invalid_chunk_offset:
            return "invalid chunk offset";
        case error_code::missing_chunks:
            return "missing chunks";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_worker_count:
            return "invalid worker count";
        case error_code::invalid_retry_policy:
            return "invalid retry policy";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::profile_not_found:
            return "profile not found";
        case error_code::profile_parse_error:
            return "profile parse error";
        case error_code::internal_error:
            return "internal error";
        case error_code::cancelled:
            return "cancelled";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::pool_stopped:
            return "pool stopped";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_TYPES_H
