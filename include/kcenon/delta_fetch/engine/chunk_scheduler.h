/**
 * @file chunk_scheduler.h
 * @brief Runs the chunk tasks of many files on one shared worker pool
 */

#ifndef KCENON_DELTA_FETCH_ENGINE_CHUNK_SCHEDULER_H
#define KCENON_DELTA_FETCH_ENGINE_CHUNK_SCHEDULER_H

#include "kcenon/delta_fetch/adapters/thread_pool_adapter.h"
#include "kcenon/delta_fetch/core/checkpoint_store.h"
#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/destination_file.h"
#include "kcenon/delta_fetch/core/event_bus.h"
#include "kcenon/delta_fetch/core/logging.h"
#include "kcenon/delta_fetch/core/types.h"
#include "kcenon/delta_fetch/engine/retrying_fetcher.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>

namespace kcenon::delta_fetch {

/**
 * @brief One file handed to the scheduler
 */
struct file_job {
    remote_item item;
    std::filesystem::path destination;           ///< Checkpoint key and final path
    chunk_plan plan;                             ///< Only pending chunks are fetched
    std::shared_ptr<destination_file> staging;   ///< Open, sized to item.size
};

/**
 * @brief Terminal state of one file's chunk tasks
 */
struct file_result {
    chunk_plan plan;                 ///< Chunk statuses at the end
    std::size_t chunks_fetched = 0;
    uint64_t bytes_fetched = 0;
    std::size_t retries = 0;
    std::optional<error> first_error;
    bool content_changed = false;    ///< Remote changed under the transfer
    bool cancelled = false;          ///< Some chunks never ran because of cancel() or pool shutdown
    bool aborted = false;            ///< A file-level error stopped the remaining chunks
};

/**
 * @brief Options for chunk_scheduler
 */
struct scheduler_options {
    bool sync_writes = true;   ///< fdatasync the staging file before each checkpoint commit
};

/**
 * @brief Feeds transfer tasks to the pool and collects per-file results
 *
 * Every pending chunk becomes one transfer_task submitted to the shared
 * pool, so tasks of different files interleave and the pool's worker count
 * bounds the concurrency of the whole run. A committed chunk is written,
 * synced, then recorded in the checkpoint store; only the commit makes it
 * resumable.
 *
 * A chunk that exhausts its retries is marked failed and its siblings keep
 * going. A fatal remote error, a content change, or a storage error marks the
 * file aborted; its tasks that have not started yet finish without fetching.
 * The future of a file resolves once every one of its tasks is terminal.
 */
class chunk_scheduler {
public:
    chunk_scheduler(std::shared_ptr<adapters::fetch_thread_pool_interface> pool,
                    std::shared_ptr<retrying_fetcher> fetcher,
                    std::shared_ptr<checkpoint_store> checkpoints,
                    std::shared_ptr<event_bus> events,
                    scheduler_options options = {},
                    std::shared_ptr<fetch_logger> logger = nullptr);

    ~chunk_scheduler();

    chunk_scheduler(const chunk_scheduler&) = delete;
    auto operator=(const chunk_scheduler&) -> chunk_scheduler& = delete;

    /**
     * @brief Schedule all pending chunks of job
     * @return Future resolved when every task of the file is terminal
     */
    [[nodiscard]] auto submit_file(file_job job) -> std::shared_future<file_result>;

    /**
     * @brief Stop starting new fetches; in-flight ones finish
     *
     * Chunks that never ran stay pending in the checkpoint.
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Files whose futures have not resolved yet
     */
    [[nodiscard]] auto active_files() const -> std::size_t;

private:
    class impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_ENGINE_CHUNK_SCHEDULER_H
