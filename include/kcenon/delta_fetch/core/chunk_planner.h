/**
 * @file chunk_planner.h
 * @brief Computes the chunks of a remote file that still need fetching
 */

#ifndef KCENON_DELTA_FETCH_CORE_CHUNK_PLANNER_H
#define KCENON_DELTA_FETCH_CORE_CHUNK_PLANNER_H

#include "kcenon/delta_fetch/core/checkpoint_store.h"
#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/types.h"

#include <cstddef>
#include <optional>

namespace kcenon::delta_fetch {

/**
 * @brief Builds chunk plans from remote metadata and prior checkpoints
 *
 * A checkpoint is reused only when its fingerprint matches the item's
 * current fingerprint, it was recorded with the same chunk size, and every
 * committed offset lies on the chunk grid. Otherwise the full file is
 * planned again.
 */
class chunk_planner {
public:
    /**
     * @param chunk_size Chunk size in bytes; must be positive
     */
    explicit chunk_planner(std::size_t chunk_size);

    /**
     * @brief Plan the transfer of one remote file
     * @param item Remote file descriptor
     * @param prior Checkpoint previously recorded for the destination, if any
     * @return Chunk plan, or invalid_remote_item for directories
     */
    [[nodiscard]] auto plan(const remote_item& item,
                            const std::optional<checkpoint>& prior = std::nullopt) const
        -> result<chunk_plan>;

    /**
     * @brief Check whether a checkpoint can be trusted for this item
     */
    [[nodiscard]] auto is_reusable(const remote_item& item, const checkpoint& prior) const -> bool;

    [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }

    /**
     * @brief Number of chunks a file of the given size divides into
     */
    [[nodiscard]] auto chunk_count(uint64_t file_size) const -> uint64_t;

private:
    std::size_t chunk_size_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_CHUNK_PLANNER_H
