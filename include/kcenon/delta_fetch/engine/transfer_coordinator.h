/**
 * @file transfer_coordinator.h
 * @brief Top-level orchestration of a delta fetch run
 */

#ifndef KCENON_DELTA_FETCH_ENGINE_TRANSFER_COORDINATOR_H
#define KCENON_DELTA_FETCH_ENGINE_TRANSFER_COORDINATOR_H

#include "kcenon/delta_fetch/adapters/thread_pool_adapter.h"
#include "kcenon/delta_fetch/core/event_bus.h"
#include "kcenon/delta_fetch/core/fetch_config.h"
#include "kcenon/delta_fetch/core/logging.h"
#include "kcenon/delta_fetch/core/transfer_types.h"
#include "kcenon/delta_fetch/core/types.h"
#include "kcenon/delta_fetch/remote/path_filter.h"
#include "kcenon/delta_fetch/remote/remote_session.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Pulls a remote tree into a local directory, chunk by chunk
 *
 * For every remote file the coordinator decides between skip, resume and a
 * fresh fetch, plans the chunks, hands them to the shared worker pool and,
 * once every chunk is committed, archives the previous local version and
 * moves the new content into place. A file's failure is recorded in the
 * run summary and never stops the other files.
 *
 * @code
 * auto session = std::make_shared<directory_remote_session>("/mnt/share");
 * auto coordinator = transfer_coordinator::builder()
 *     .with_worker_count(8)
 *     .with_logger(logger)
 *     .build(session);
 * if (coordinator) {
 *     auto summary = coordinator.value().run("reports", "/data/reports");
 * }
 * @endcode
 */
class transfer_coordinator {
public:
    /**
     * @brief Builder for transfer_coordinator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(coordinator_config config) -> builder&;

        /**
         * @brief Set the number of concurrent chunk fetches (default: 4)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Set the chunk size in bytes (default: 1MB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        auto with_archive_policy(archive_policy policy) -> builder&;

        /**
         * @brief Directory for archived versions (default: `<root>/.versions`)
         */
        auto with_history_directory(std::filesystem::path dir) -> builder&;

        /**
         * @brief Directory for checkpoint records (default: `<root>/.delta_fetch/state`)
         */
        auto with_state_directory(std::filesystem::path dir) -> builder&;

        auto with_logger(std::shared_ptr<fetch_logger> logger) -> builder&;

        /**
         * @brief Use an existing pool instead of creating one
         *
         * A supplied pool is never shut down by the coordinator.
         */
        auto with_thread_pool(std::shared_ptr<adapters::fetch_thread_pool_interface> pool)
            -> builder&;

        auto with_path_filter(std::shared_ptr<path_filter> filter) -> builder&;

        /**
         * @brief Register an observer before the first event
         */
        auto with_observer(std::shared_ptr<fetch_observer> observer) -> builder&;

        /**
         * @brief Validate the configuration and build the coordinator
         * @return Coordinator, or a configuration error
         */
        [[nodiscard]] auto build(std::shared_ptr<remote_session> session)
            -> result<transfer_coordinator>;

    private:
        coordinator_config config_;
        std::shared_ptr<fetch_logger> logger_;
        std::shared_ptr<adapters::fetch_thread_pool_interface> pool_;
        std::shared_ptr<path_filter> filter_;
        std::vector<std::shared_ptr<fetch_observer>> observers_;
    };

    transfer_coordinator(const transfer_coordinator&) = delete;
    auto operator=(const transfer_coordinator&) -> transfer_coordinator& = delete;
    transfer_coordinator(transfer_coordinator&&) noexcept;
    auto operator=(transfer_coordinator&&) noexcept -> transfer_coordinator&;
    ~transfer_coordinator();

    /**
     * @brief Authenticate the remote session and fire an auth event
     */
    [[nodiscard]] auto authenticate() -> result<session_info>;

    /**
     * @brief List one remote directory level and fire a listing event
     */
    [[nodiscard]] auto list_contents(const std::string& remote_path)
        -> result<std::vector<remote_item>>;

    /**
     * @brief Fetch remote_path (a file or a directory tree) into local_root
     *
     * Authenticates first if needed. Per-file failures are reported in the
     * summary; an error is returned only when the run cannot start
     * (authentication, missing remote root, unusable local root).
     */
    [[nodiscard]] auto run(const std::string& remote_path,
                           const std::filesystem::path& local_root) -> result<run_summary>;

    /**
     * @brief Request cancellation of the current run
     *
     * Only sets a flag, so it may be called from a signal handler. Chunks
     * not committed yet stay pending for the next run.
     */
    void cancel() noexcept;

    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto events() -> event_bus&;

    [[nodiscard]] auto config() const -> const coordinator_config&;

private:
    class impl;

    explicit transfer_coordinator(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_ENGINE_TRANSFER_COORDINATOR_H
