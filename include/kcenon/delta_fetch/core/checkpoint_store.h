/**
 * @file checkpoint_store.h
 * @brief Durable per-destination record of committed chunks
 *
 * The checkpoint is the authority on which chunks of a destination can be
 * trusted after a restart: bytes written to the staging file without a
 * matching commit are fetched again on the next run.
 */

#ifndef KCENON_DELTA_FETCH_CORE_CHECKPOINT_STORE_H
#define KCENON_DELTA_FETCH_CORE_CHECKPOINT_STORE_H

#include "kcenon/delta_fetch/core/logging.h"
#include "kcenon/delta_fetch/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Overall state of a checkpoint
 */
enum class checkpoint_state {
    in_progress,
    complete
};

[[nodiscard]] constexpr auto to_string(checkpoint_state state) -> const char* {
    switch (state) {
        case checkpoint_state::in_progress: return "in_progress";
        case checkpoint_state::complete: return "complete";
        default: return "unknown";
    }
}

/**
 * @brief Persisted resume record of one destination file
 */
struct checkpoint {
    std::filesystem::path destination;
    std::string fingerprint;                 ///< Remote fingerprint at plan time
    uint64_t file_size = 0;
    uint64_t chunk_size = 0;
    std::set<uint64_t> committed_offsets;
    checkpoint_state state = checkpoint_state::in_progress;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    /**
     * @brief Number of chunks the file divides into
     */
    [[nodiscard]] auto expected_chunk_count() const -> uint64_t;

    /**
     * @brief True when the committed set covers every chunk
     */
    [[nodiscard]] auto all_chunks_committed() const -> bool;

    [[nodiscard]] auto is_complete() const -> bool {
        return state == checkpoint_state::complete;
    }
};

/**
 * @brief Configuration for checkpoint_store
 */
struct checkpoint_store_config {
    std::filesystem::path state_directory;   ///< Directory for checkpoint records
    bool sync_on_commit = true;              ///< fsync each record rewrite
    std::chrono::seconds state_ttl{7 * 24 * 3600};  ///< Age after which in_progress records expire

    /**
     * @brief Default constructor, records go to the system temp directory
     */
    checkpoint_store_config();

    explicit checkpoint_store_config(std::filesystem::path dir);
};

/**
 * @brief Store of checkpoint records, one JSON file per destination
 *
 * Thread-safe. Commits for the same destination are serialized by that
 * destination's own mutex and each commit rewrites the record atomically
 * (write temp file, fsync, rename) before returning. Commits for different
 * destinations never contend.
 *
 * @code
 * checkpoint_store store(checkpoint_store_config{"/var/lib/df/state"}, logger);
 * store.begin(dest, item.fingerprint().to_string(), item.size, chunk_size);
 * store.commit(dest, 0);
 * store.commit(dest, chunk_size);
 * store.finalize(dest);
 * @endcode
 */
class checkpoint_store {
public:
    explicit checkpoint_store(const checkpoint_store_config& config,
                              std::shared_ptr<fetch_logger> logger = nullptr);

    checkpoint_store(const checkpoint_store&) = delete;
    auto operator=(const checkpoint_store&) -> checkpoint_store& = delete;
    checkpoint_store(checkpoint_store&&) noexcept;
    auto operator=(checkpoint_store&&) noexcept -> checkpoint_store&;
    ~checkpoint_store();

    /**
     * @brief Load the checkpoint of a destination
     * @return checkpoint, or checkpoint_not_found / checkpoint_corrupted
     */
    [[nodiscard]] auto load(const std::filesystem::path& destination) -> result<checkpoint>;

    /**
     * @brief Create (or replace) an in_progress record with no committed chunks
     */
    [[nodiscard]] auto begin(const std::filesystem::path& destination,
                             const std::string& fingerprint,
                             uint64_t file_size,
                             uint64_t chunk_size) -> result<void>;

    /**
     * @brief Durably record one committed chunk
     *
     * Returns only after the record containing offset is on disk.
     */
    [[nodiscard]] auto commit(const std::filesystem::path& destination,
                              uint64_t chunk_offset) -> result<void>;

    /**
     * @brief Mark the checkpoint complete
     * @return missing_chunks if not every chunk is committed
     */
    [[nodiscard]] auto finalize(const std::filesystem::path& destination) -> result<void>;

    /**
     * @brief Record an already-present file as completely fetched
     */
    [[nodiscard]] auto mark_complete(const std::filesystem::path& destination,
                                     const std::string& fingerprint,
                                     uint64_t file_size,
                                     uint64_t chunk_size) -> result<void>;

    /**
     * @brief Drop the checkpoint of a destination
     */
    [[nodiscard]] auto invalidate(const std::filesystem::path& destination) -> result<void>;

    [[nodiscard]] auto has_checkpoint(const std::filesystem::path& destination) const -> bool;

    /**
     * @brief All readable checkpoints in the state directory
     */
    [[nodiscard]] auto list_checkpoints() const -> std::vector<checkpoint>;

    /**
     * @brief Remove in_progress records older than the configured TTL
     * @return Number of records removed
     */
    auto cleanup_expired() -> std::size_t;

    [[nodiscard]] auto config() const -> const checkpoint_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_CHECKPOINT_STORE_H
