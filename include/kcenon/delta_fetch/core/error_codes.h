/**
 * @file error_codes.h
 * @brief Error classification for delta_fetch
 *
 * Groups error_code values into the kinds the engine reacts to:
 * - transient_network : retried with backoff inside the fetch loop
 * - fatal_remote      : aborts the affected file only
 * - checksum_mismatch : invalidates the checkpoint and forces a replan
 * - storage           : local disk problem, aborts the affected file
 */

#ifndef KCENON_DELTA_FETCH_CORE_ERROR_CODES_H
#define KCENON_DELTA_FETCH_CORE_ERROR_CODES_H

#include "kcenon/delta_fetch/core/types.h"

#include <cstdint>
#include <string_view>

namespace kcenon::delta_fetch {

/**
 * @brief Engine-level classification of an error
 */
enum class error_kind {
    none,
    transient_network,
    fatal_remote,
    checksum_mismatch,
    storage,
    configuration,
    cancelled,
    internal,
};

[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case error_kind::none:
            return "none";
        case error_kind::transient_network:
            return "transient_network";
        case error_kind::fatal_remote:
            return "fatal_remote";
        case error_kind::checksum_mismatch:
            return "checksum_mismatch";
        case error_kind::storage:
            return "storage";
        case error_kind::configuration:
            return "configuration";
        case error_kind::cancelled:
            return "cancelled";
        case error_kind::internal:
            return "internal";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if error code is in remote transport error range
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -100 && v >= -119;
}

/**
 * @brief Check if error code is in remote item error range
 */
[[nodiscard]] constexpr auto is_remote_item_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -120 && v >= -139;
}

/**
 * @brief Check if error code is in local storage error range
 */
[[nodiscard]] constexpr auto is_storage_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -140 && v >= -159;
}

/**
 * @brief Check if error code is in checkpoint error range
 */
[[nodiscard]] constexpr auto is_checkpoint_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -180 && v >= -199;
}

/**
 * @brief Check if the error is worth retrying
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_lost:
        case error_code::remote_unavailable:
        case error_code::remote_throttled:
        case error_code::remote_short_read:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Map an error code to the kind of reaction it needs
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_kind {
    if (code == error_code::success) {
        return error_kind::none;
    }
    if (is_retryable(code)) {
        return error_kind::transient_network;
    }
    switch (code) {
        case error_code::remote_content_changed:
        case error_code::content_hash_mismatch:
            return error_kind::checksum_mismatch;
        case error_code::cancelled:
            return error_kind::cancelled;
        default:
            break;
    }
    if (is_transport_error(code) || is_remote_item_error(code)) {
        return error_kind::fatal_remote;
    }
    if (is_storage_error(code) || is_checkpoint_error(code)) {
        return error_kind::storage;
    }
    if (is_config_error(code)) {
        return error_kind::configuration;
    }
    return error_kind::internal;
}

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_ERROR_CODES_H
