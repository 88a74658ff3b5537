/**
 * @file version_archiver.h
 * @brief Moves replaced local files into a history directory
 */

#ifndef KCENON_DELTA_FETCH_CORE_VERSION_ARCHIVER_H
#define KCENON_DELTA_FETCH_CORE_VERSION_ARCHIVER_H

#include "kcenon/delta_fetch/core/fetch_config.h"
#include "kcenon/delta_fetch/core/logging.h"
#include "kcenon/delta_fetch/core/types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Record of one archived file
 *
 * Written once, next to the archived file, as `<archived_path>.meta.json`.
 */
struct archived_version {
    std::filesystem::path original_path;
    std::filesystem::path archived_path;
    uint32_t version = 0;                      ///< 1 for the oldest archived copy
    std::string checksum;                      ///< SHA-256 of the archived bytes
    std::chrono::system_clock::time_point original_mtime;
    std::chrono::system_clock::time_point archived_at;
};

/**
 * @brief Configuration for version_archiver
 */
struct archive_config {
    std::filesystem::path history_root;   ///< Where archived copies live
    std::filesystem::path tree_root;      ///< Destinations are named relative to this
    archive_policy policy = archive_policy::if_changed;
};

/**
 * @brief Preserves the previous version of a destination before replacement
 *
 * An archived copy keeps the destination's path relative to tree_root and
 * gets a `.<YYYYmmddTHHMMSS>` suffix (plus `-N` on collision), so
 * `<root>/docs/a.txt` becomes `<history>/docs/a.txt.20250101T120000`.
 */
class version_archiver {
public:
    explicit version_archiver(archive_config config,
                              std::shared_ptr<fetch_logger> logger = nullptr);

    /**
     * @brief Archive the current destination if the policy calls for it
     *
     * @param destination File about to be replaced
     * @param incoming_sha256 Hash of the replacing content, when known
     * @return The archived version, nullopt when nothing was archived
     *         (no existing file, unchanged content, or policy never)
     */
    [[nodiscard]] auto archive_if_needed(const std::filesystem::path& destination,
                                         const std::optional<std::string>& incoming_sha256)
        -> result<std::optional<archived_version>>;

    /**
     * @brief Archived versions of a destination, oldest first
     */
    [[nodiscard]] auto versions(const std::filesystem::path& destination) const
        -> std::vector<archived_version>;

    [[nodiscard]] auto config() const -> const archive_config& { return config_; }

private:
    [[nodiscard]] auto relative_name(const std::filesystem::path& destination) const
        -> std::filesystem::path;

    [[nodiscard]] auto move_into_history(const std::filesystem::path& source,
                                         const std::filesystem::path& target) -> result<void>;

    archive_config config_;
    std::shared_ptr<fetch_logger> logger_;
    std::mutex mutex_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_VERSION_ARCHIVER_H
