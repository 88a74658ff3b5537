/**
 * @file json_utils.h
 * @brief Minimal JSON helpers for the flat records delta_fetch persists
 *
 * Checkpoints, version sidecars, filter profiles and run reports are small
 * documents with a fixed shape, so they are written with ostringstream and
 * read back with these key lookups rather than a general parser.
 */

#ifndef KCENON_DELTA_FETCH_CORE_JSON_UTILS_H
#define KCENON_DELTA_FETCH_CORE_JSON_UTILS_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::delta_fetch::detail {

[[nodiscard]] auto escape_json_string(std::string_view s) -> std::string;

[[nodiscard]] auto unescape_json_string(std::string_view s) -> std::string;

/**
 * @brief Find the value of the first "key": in json
 * @return Unescaped string contents for a string value, the raw token for a
 *         number/bool/null, or nullopt if the key is absent
 */
[[nodiscard]] auto extract_json_value(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Find the array value of "key" and split its elements
 *
 * String elements are unescaped; scalar elements are returned as raw tokens.
 * Nested arrays or objects are not supported.
 */
[[nodiscard]] auto extract_json_array(std::string_view json, std::string_view key)
    -> std::optional<std::vector<std::string>>;

/**
 * @brief Find the object value of "key", braces included
 */
[[nodiscard]] auto extract_json_object(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

[[nodiscard]] auto to_epoch_ms(std::chrono::system_clock::time_point tp) -> int64_t;

[[nodiscard]] auto from_epoch_ms(int64_t ms) -> std::chrono::system_clock::time_point;

/**
 * @brief Local time as YYYYmmddTHHMMSS
 */
[[nodiscard]] auto compact_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief UTC time as ISO 8601 with seconds precision
 */
[[nodiscard]] auto iso8601_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Convert a filesystem timestamp to system_clock
 */
[[nodiscard]] auto to_system_time(std::filesystem::file_time_type ft)
    -> std::chrono::system_clock::time_point;

/**
 * @brief Convert a system_clock timestamp to a filesystem timestamp
 */
[[nodiscard]] auto to_file_time(std::chrono::system_clock::time_point tp)
    -> std::filesystem::file_time_type;

}  // namespace kcenon::delta_fetch::detail

#endif  // KCENON_DELTA_FETCH_CORE_JSON_UTILS_H
