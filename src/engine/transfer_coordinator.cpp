/**
 * @file transfer_coordinator.cpp
 * @brief Implementation of transfer_coordinator
 */

#include "kcenon/delta_fetch/engine/transfer_coordinator.h"
#include "kcenon/delta_fetch/core/checkpoint_store.h"
#include "kcenon/delta_fetch/core/checksum.h"
#include "kcenon/delta_fetch/core/chunk_planner.h"
#include "kcenon/delta_fetch/core/destination_file.h"
#include "kcenon/delta_fetch/core/error_codes.h"
#include "kcenon/delta_fetch/core/json_utils.h"
#include "kcenon/delta_fetch/core/version_archiver.h"
#include "kcenon/delta_fetch/engine/chunk_scheduler.h"
#include "kcenon/delta_fetch/engine/retrying_fetcher.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <optional>
#include <set>

namespace kcenon::delta_fetch {

namespace {

constexpr const char* STAGING_SUFFIX = ".dfpart";
constexpr const char* STATE_DIRECTORY = ".delta_fetch";
constexpr const char* HISTORY_DIRECTORY = ".versions";
constexpr auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds(50);

auto staging_path_for(const std::filesystem::path& destination) -> std::filesystem::path {
    auto staging = destination;
    staging += STAGING_SUFFIX;
    return staging;
}

auto has_staging_suffix(const std::string& name) -> bool {
    static const std::string suffix = STAGING_SUFFIX;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto local_file_size(const std::filesystem::path& path) -> std::optional<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

auto local_mtime_ms(const std::filesystem::path& path) -> std::optional<int64_t> {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return detail::to_epoch_ms(detail::to_system_time(mtime));
}

auto digests_equal(const std::string& a, const std::string& b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

void mark_failed(file_report& report, error err) {
    report.outcome = file_outcome::failed;
    report.failure = std::move(err);
}

struct work_item {
    remote_item item;
    std::filesystem::path destination;
};

/**
 * @brief One file moving through a run
 *
 * pending is set while the file's chunk tasks are on the pool; once it is
 * empty again the report is final.
 */
struct file_transfer {
    work_item work;
    file_report report;
    std::shared_ptr<destination_file> staging;
    std::optional<std::shared_future<file_result>> pending;
};

}  // namespace

// ============================================================================
// transfer_coordinator::impl
// ============================================================================

class transfer_coordinator::impl {
public:
    impl(coordinator_config cfg,
         std::shared_ptr<remote_session> remote,
         std::shared_ptr<fetch_logger> log,
         std::shared_ptr<adapters::fetch_thread_pool_interface> workers,
         bool owns_workers,
         std::shared_ptr<path_filter> path_filter)
        : config(std::move(cfg))
        , session(std::move(remote))
        , logger(std::move(log))
        , pool(std::move(workers))
        , owns_pool(owns_workers)
        , filter(std::move(path_filter))
        , events(std::make_shared<event_bus>(logger))
        , planner(config.chunk_size) {}

    /**
     * @brief Collaborators that live for one run
     */
    struct run_context {
        std::filesystem::path local_root;
        std::filesystem::path state_root;
        std::filesystem::path history_root;
        std::shared_ptr<checkpoint_store> checkpoints;
        std::unique_ptr<version_archiver> archiver;
        std::shared_ptr<chunk_scheduler> scheduler;
        bool cancel_propagated = false;
    };

    auto authenticate() -> result<session_info> {
        auto authenticated = session->authenticate();

        auth_event event;
        if (authenticated) {
            event.account = authenticated.value().account;
            event.session_id = authenticated.value().session_id;
            event.success = true;
            session_details = authenticated.value();
            DF_LOG_INFO(*logger, log_category::session,
                "Authenticated as " + event.account + " (session " + event.session_id + ")");
        } else {
            event.error_message = authenticated.error().message;
            DF_LOG_ERROR(*logger, log_category::session,
                "Authentication failed: " + authenticated.error().message);
        }
        events->dispatch(event);
        return authenticated;
    }

    auto ensure_authenticated() -> result<void> {
        if (session_details) {
            return {};
        }
        auto authenticated = authenticate();
        if (!authenticated) {
            return unexpected(authenticated.error());
        }
        return {};
    }

    auto list_contents(const std::string& remote_path) -> result<std::vector<remote_item>> {
        auto children = session->list_children(remote_path);
        if (!children) {
            DF_LOG_ERROR(*logger, log_category::session,
                "Failed to list " + remote_path + ": " + children.error().message);
            return children;
        }

        listing_event event;
        event.remote_path = remote_path;
        event.children = children.value();
        events->dispatch(event);
        return children;
    }

    auto make_context(const std::filesystem::path& local_root) -> run_context {
        run_context ctx;
        ctx.local_root = local_root;

        ctx.state_root = config.state_directory.empty()
            ? local_root / STATE_DIRECTORY / "state"
            : config.state_directory;
        checkpoint_store_config store_config(ctx.state_root);
        store_config.sync_on_commit = config.sync_writes;
        store_config.state_ttl = config.checkpoint_ttl;
        ctx.checkpoints = std::make_shared<checkpoint_store>(store_config, logger);

        archive_config history;
        ctx.history_root = config.history_directory.empty()
            ? local_root / HISTORY_DIRECTORY
            : config.history_directory;
        history.history_root = ctx.history_root;
        history.tree_root = local_root;
        history.policy = config.archive;
        ctx.archiver = std::make_unique<version_archiver>(history, logger);

        auto fetcher = std::make_shared<retrying_fetcher>(session, config.retry, logger);
        scheduler_options options;
        options.sync_writes = config.sync_writes;
        ctx.scheduler = std::make_shared<chunk_scheduler>(
            pool, std::move(fetcher), ctx.checkpoints, events, options, logger);
        return ctx;
    }

    // ------------------------------------------------------------------------
    // Tree walk
    // ------------------------------------------------------------------------

    /**
     * @brief Why a remote child cannot be written at its local path, if it cannot
     *
     * Remote names are fetched as they are, including ones that look like our
     * own bookkeeping. Only a name whose local path is the state or history
     * root, or the staging file of a sibling, is refused.
     */
    static auto placement_conflict(const run_context& ctx, const remote_item& child,
                                   const std::filesystem::path& local,
                                   const std::set<std::string>& sibling_files)
        -> std::optional<std::string> {
        auto normal = local.lexically_normal();
        if (normal == ctx.state_root.lexically_normal()) {
            return "destination " + local.string() + " is the checkpoint directory";
        }
        if (normal == ctx.history_root.lexically_normal()) {
            return "destination " + local.string() + " is the version history directory";
        }
        if (child.is_file() && has_staging_suffix(child.name)) {
            auto stem = child.name.substr(0, child.name.size() - std::string(STAGING_SUFFIX).size());
            if (sibling_files.count(stem) > 0) {
                return "destination " + local.string() + " is the staging file of " + stem;
            }
        }
        return std::nullopt;
    }

    void collect(const run_context& ctx,
                 const remote_item& directory, const std::filesystem::path& local_dir,
                 const std::string& prefix, std::vector<work_item>& work, run_summary& summary) {
        if (cancelled.load(std::memory_order_acquire)) {
            return;
        }

        auto children = list_contents(directory.path);
        if (!children) {
            file_report report;
            report.remote_path = directory.path;
            report.destination = local_dir;
            mark_failed(report, children.error());
            record(directory, report, summary);
            return;
        }

        std::set<std::string> sibling_files;
        for (const auto& child : children.value()) {
            if (child.is_file()) {
                sibling_files.insert(child.name);
            }
        }

        for (const auto& child : children.value()) {
            auto relative = prefix.empty() ? child.name : prefix + "/" + child.name;
            if (filter && !filter->should_include(relative, child.kind)) {
                DF_LOG_DEBUG(*logger, log_category::coordinator, "Filtered out " + relative);
                continue;
            }

            auto local = local_dir / child.name;
            if (auto conflict = placement_conflict(ctx, child, local, sibling_files)) {
                DF_LOG_WARN(*logger, log_category::coordinator,
                    "Not fetching " + child.path + ": " + *conflict);
                file_report report;
                report.remote_path = child.path;
                report.destination = local;
                mark_failed(report, error(error_code::invalid_remote_item, *conflict));
                record(child, report, summary);
                continue;
            }
            if (!child.is_directory()) {
                work.push_back(work_item{child, local});
                continue;
            }

            std::error_code ec;
            std::filesystem::create_directories(local, ec);
            if (ec) {
                file_report report;
                report.remote_path = child.path;
                report.destination = local;
                mark_failed(report, error(error_code::directory_create_failed,
                    "failed to create " + local.string() + ": " + ec.message()));
                record(child, report, summary);
                continue;
            }
            collect(ctx, child, local, relative, work, summary);
        }
    }

    // ------------------------------------------------------------------------
    // Per-file decisions
    // ------------------------------------------------------------------------

    void discard(run_context& ctx, const std::filesystem::path& destination) {
        auto dropped = ctx.checkpoints->invalidate(destination);
        if (!dropped) {
            DF_LOG_WARN(*logger, log_category::coordinator,
                "Failed to drop checkpoint of " + destination.string() + ": " +
                dropped.error().message);
        }
        std::error_code ec;
        std::filesystem::remove(staging_path_for(destination), ec);
    }

    /**
     * @brief Load the checkpoint of a destination if it can still be trusted
     *
     * Stale records (remote changed, chunk size changed, staging or
     * destination file gone) are discarded together with the staging file.
     */
    auto usable_checkpoint(run_context& ctx, const remote_item& item,
                           const std::filesystem::path& destination)
        -> result<std::optional<checkpoint>> {
        auto loaded = ctx.checkpoints->load(destination);
        if (!loaded) {
            if (loaded.error().code == error_code::checkpoint_not_found) {
                return std::optional<checkpoint>{};
            }
            if (loaded.error().code == error_code::checkpoint_corrupted) {
                DF_LOG_WARN(*logger, log_category::coordinator,
                    "Discarding unreadable checkpoint of " + destination.string());
                discard(ctx, destination);
                return std::optional<checkpoint>{};
            }
            return unexpected(loaded.error());
        }

        const auto& prior = loaded.value();
        std::string reason;
        if (!planner.is_reusable(item, prior)) {
            reason = "remote fingerprint or chunk size changed";
        } else if (prior.is_complete()) {
            if (local_file_size(destination) != std::optional<uint64_t>(item.size)) {
                reason = "destination missing or modified";
            }
        } else if (local_file_size(staging_path_for(destination)) !=
                   std::optional<uint64_t>(item.size)) {
            reason = "staging file missing";
        }

        if (!reason.empty()) {
            DF_LOG_INFO(*logger, log_category::coordinator,
                "Discarding checkpoint of " + destination.string() + ": " + reason);
            discard(ctx, destination);
            return std::optional<checkpoint>{};
        }
        return std::optional<checkpoint>{loaded.value()};
    }

    /**
     * @brief True when the destination already holds the remote content
     */
    auto matches_local_copy(const remote_item& item, const std::filesystem::path& destination)
        -> bool {
        if (local_file_size(destination) != std::optional<uint64_t>(item.size) ||
            local_mtime_ms(destination) != std::optional<int64_t>(item.fingerprint().mtime_ms)) {
            return false;
        }
        if (item.sha256) {
            return checksum::verify_sha256(destination, *item.sha256);
        }
        return true;
    }

    /**
     * @brief Decide skip, resume or fresh fetch and submit the chunk tasks
     *
     * On return either t.pending is set or t.report is final.
     */
    void prepare(run_context& ctx, file_transfer& t) {
        const auto& item = t.work.item;
        const auto& destination = t.work.destination;

        t.report.remote_path = item.path;
        t.report.destination = destination;
        t.report.size = item.size;
        t.report.chunks_total = static_cast<std::size_t>(planner.chunk_count(item.size));

        if (cancelled.load(std::memory_order_acquire)) {
            t.report.outcome = file_outcome::cancelled;
            return;
        }

        auto prior = usable_checkpoint(ctx, item, destination);
        if (!prior) {
            mark_failed(t.report, prior.error());
            return;
        }

        if (prior.value() && prior.value()->is_complete()) {
            t.report.outcome = file_outcome::skipped;
            return;
        }

        if (!prior.value() && matches_local_copy(item, destination)) {
            auto adopted = ctx.checkpoints->mark_complete(
                destination, item.fingerprint().to_string(), item.size, config.chunk_size);
            if (!adopted) {
                DF_LOG_WARN(*logger, log_category::coordinator,
                    "Failed to record existing " + destination.string() + ": " +
                    adopted.error().message);
            }
            t.report.outcome = file_outcome::skipped;
            return;
        }

        auto plan = planner.plan(item, prior.value());
        if (!plan) {
            mark_failed(t.report, plan.error());
            return;
        }

        if (!prior.value()) {
            auto begun = ctx.checkpoints->begin(
                destination, item.fingerprint().to_string(), item.size, config.chunk_size);
            if (!begun) {
                mark_failed(t.report, begun.error());
                return;
            }
        }

        auto staging = destination_file::open(
            staging_path_for(destination), item.size, config.sync_writes);
        if (!staging) {
            mark_failed(t.report, staging.error());
            return;
        }
        t.staging = staging.value();

        fetch_log_context log_ctx;
        log_ctx.remote_path = item.path;
        log_ctx.destination = destination.string();
        log_ctx.total_chunks = plan.value().size();
        log_ctx.bytes = item.size;
        DF_LOG_INFO_CTX(*logger, log_category::coordinator,
            prior.value() ? "Resuming " + std::to_string(plan.value().pending_count()) +
                                " pending chunks"
                          : std::string("Fetching"),
            log_ctx);

        start_event started;
        started.item = item;
        started.destination = destination;
        started.chunks_pending = plan.value().pending_count();
        started.chunks_total = plan.value().size();
        events->dispatch(started);

        file_job job;
        job.item = item;
        job.destination = destination;
        job.plan = std::move(plan.value());
        job.staging = t.staging;
        t.pending = ctx.scheduler->submit_file(std::move(job));
    }

    auto wait_for(run_context& ctx, const std::shared_future<file_result>& future) -> file_result {
        while (future.wait_for(CANCEL_POLL_INTERVAL) != std::future_status::ready) {
            if (cancelled.load(std::memory_order_acquire) && !ctx.cancel_propagated) {
                ctx.cancel_propagated = true;
                DF_LOG_WARN(*logger, log_category::coordinator,
                    "Cancellation requested, stopping chunk tasks");
                ctx.scheduler->cancel();
                if (owns_pool) {
                    pool->shutdown();
                }
            }
        }
        return future.get();
    }

    /**
     * @brief Verify, archive and move a fully committed staging file into place
     */
    auto place(run_context& ctx, file_transfer& t) -> result<void> {
        const auto& item = t.work.item;
        const auto& destination = t.work.destination;
        auto staging_path = staging_path_for(destination);

        auto digest = checksum::sha256_file(staging_path);
        if (!digest) {
            return unexpected(digest.error());
        }
        if (item.sha256 && !digests_equal(*item.sha256, digest.value())) {
            return unexpected(error(error_code::content_hash_mismatch,
                "SHA-256 of fetched " + item.path + " does not match the remote"));
        }
        t.report.sha256 = digest.value();

        std::error_code ec;
        std::filesystem::last_write_time(staging_path, detail::to_file_time(item.modified), ec);
        if (ec) {
            DF_LOG_WARN(*logger, log_category::coordinator,
                "Failed to set modification time of " + staging_path.string() + ": " +
                ec.message());
        }

        auto archived = ctx.archiver->archive_if_needed(destination, digest.value());
        if (!archived) {
            return unexpected(archived.error());
        }
        if (archived.value()) {
            t.report.archived_to = archived.value()->archived_path;
        }

        std::filesystem::rename(staging_path, destination, ec);
        if (ec) {
            return unexpected(error(error_code::file_rename_failed,
                "failed to move " + staging_path.string() + " to " + destination.string() +
                ": " + ec.message()));
        }

        auto finalized = ctx.checkpoints->finalize(destination);
        if (!finalized) {
            DF_LOG_WARN(*logger, log_category::checkpoint,
                "Fetched " + destination.string() + " but could not finalize its checkpoint: " +
                finalized.error().message);
        }
        return {};
    }

    /**
     * @brief Start over after the remote changed under the transfer
     * @return false when the replan budget is spent
     */
    auto replan(run_context& ctx, file_transfer& t) -> bool {
        discard(ctx, t.work.destination);
        if (t.report.replans >= config.max_replans || cancelled.load(std::memory_order_acquire)) {
            return false;
        }

        auto fresh = session->stat(t.work.item.path);
        if (!fresh) {
            mark_failed(t.report, fresh.error());
            return true;
        }
        if (!fresh.value().is_file()) {
            mark_failed(t.report, error(error_code::invalid_remote_item,
                t.work.item.path + " is no longer a file"));
            return true;
        }

        ++t.report.replans;
        DF_LOG_INFO(*logger, log_category::coordinator,
            "Remote content of " + t.work.item.path + " changed, replanning (" +
            std::to_string(t.report.replans) + "/" + std::to_string(config.max_replans) + ")");
        t.work.item = std::move(fresh.value());
        prepare(ctx, t);
        return true;
    }

    /**
     * @brief Wait for the chunk tasks of t and settle its report
     */
    void complete(run_context& ctx, file_transfer& t) {
        while (t.pending) {
            auto result = wait_for(ctx, *t.pending);
            t.pending.reset();

            t.report.chunks_fetched += result.chunks_fetched;
            t.report.bytes_fetched += result.bytes_fetched;
            t.report.retries += result.retries;
            t.report.chunks_failed = result.plan.failed_count();

            auto closed = t.staging->close();
            t.staging.reset();

            if (result.plan.is_complete()) {
                if (!closed) {
                    mark_failed(t.report, closed.error());
                    return;
                }
                auto placed = place(ctx, t);
                if (placed) {
                    t.report.outcome = file_outcome::committed;
                    return;
                }
                if (classify(placed.error().code) == error_kind::checksum_mismatch &&
                    replan(ctx, t)) {
                    continue;
                }
                if (classify(placed.error().code) == error_kind::checksum_mismatch) {
                    discard(ctx, t.work.destination);
                }
                mark_failed(t.report, placed.error());
                return;
            }

            if (result.content_changed) {
                if (replan(ctx, t)) {
                    continue;
                }
                mark_failed(t.report, result.first_error.value_or(
                    error(error_code::remote_content_changed)));
                return;
            }

            if (result.cancelled && !result.aborted) {
                t.report.outcome = file_outcome::cancelled;
                return;
            }

            auto failure = result.first_error.value_or(error(error_code::missing_chunks,
                std::to_string(result.plan.pending_count() + result.plan.failed_count()) +
                " chunks of " + t.work.item.path + " were not fetched"));
            if (classify(failure.code) == error_kind::fatal_remote) {
                discard(ctx, t.work.destination);
            }
            mark_failed(t.report, std::move(failure));
        }
    }

    void record(const remote_item& item, const file_report& report, run_summary& summary) {
        fetch_log_context log_ctx;
        log_ctx.remote_path = report.remote_path;
        log_ctx.destination = report.destination.string();
        log_ctx.bytes = report.bytes_fetched;
        log_ctx.total_chunks = report.chunks_total;
        log_ctx.outcome = to_string(report.outcome);

        switch (report.outcome) {
            case file_outcome::committed:
                DF_LOG_INFO_CTX(*logger, log_category::coordinator, "File committed", log_ctx);
                break;
            case file_outcome::skipped:
                DF_LOG_DEBUG_CTX(*logger, log_category::coordinator, "File up to date", log_ctx);
                break;
            case file_outcome::failed:
                if (report.failure) {
                    log_ctx.error_message = report.failure->message;
                }
                DF_LOG_ERROR_CTX(*logger, log_category::coordinator, "File failed", log_ctx);
                break;
            case file_outcome::cancelled:
                DF_LOG_WARN_CTX(*logger, log_category::coordinator, "File cancelled", log_ctx);
                break;
        }

        complete_event event;
        event.item = item;
        event.destination = report.destination;
        event.outcome = report.outcome;
        event.success = report.outcome == file_outcome::committed ||
                        report.outcome == file_outcome::skipped;
        if (report.failure) {
            event.error_message = report.failure->message;
        }
        events->dispatch(event);

        summary.add(report);
    }

    // ------------------------------------------------------------------------
    // Run
    // ------------------------------------------------------------------------

    auto run(const std::string& remote_path, const std::filesystem::path& local_root)
        -> result<run_summary> {
        cancelled.store(false, std::memory_order_release);

        run_summary summary;
        summary.started_at = std::chrono::system_clock::now();

        auto authenticated = ensure_authenticated();
        if (!authenticated) {
            return unexpected(authenticated.error());
        }

        std::error_code ec;
        std::filesystem::create_directories(local_root, ec);
        if (ec) {
            return unexpected(error(error_code::directory_create_failed,
                "failed to create " + local_root.string() + ": " + ec.message()));
        }

        auto root = session->stat(remote_path);
        if (!root) {
            DF_LOG_ERROR(*logger, log_category::coordinator,
                "Cannot fetch " + remote_path + ": " + root.error().message);
            return unexpected(root.error());
        }

        if (owns_pool && !pool->is_running()) {
            pool = adapters::fetch_pool_factory::create(config.worker_count);
        }

        auto ctx = make_context(local_root);
        auto expired = ctx.checkpoints->cleanup_expired();
        if (expired > 0) {
            DF_LOG_DEBUG(*logger, log_category::checkpoint,
                "Removed " + std::to_string(expired) + " expired checkpoints");
        }

        std::vector<work_item> work;
        if (root.value().is_file()) {
            work.push_back(work_item{root.value(), local_root / root.value().name});
        } else {
            collect(ctx, root.value(), local_root, "", work, summary);
        }

        DF_LOG_INFO(*logger, log_category::coordinator,
            "Fetching " + std::to_string(work.size()) + " files from " + remote_path +
            " into " + local_root.string());

        std::vector<file_transfer> transfers(work.size());
        for (std::size_t i = 0; i < work.size(); ++i) {
            transfers[i].work = std::move(work[i]);
        }

        // Keep a bounded number of files in flight so their tasks interleave
        // without holding a staging descriptor for every file of the tree.
        const auto window = std::max<std::size_t>(config.worker_count * 4, 8);
        std::size_t next_to_prepare = 0;
        for (std::size_t i = 0; i < transfers.size(); ++i) {
            while (next_to_prepare < transfers.size() && next_to_prepare < i + window) {
                prepare(ctx, transfers[next_to_prepare++]);
            }
            complete(ctx, transfers[i]);
            record(transfers[i].work.item, transfers[i].report, summary);
        }

        summary.was_cancelled = cancelled.load(std::memory_order_acquire);
        summary.finished_at = std::chrono::system_clock::now();

        session_event finished;
        finished.total_files = summary.total_files();
        finished.committed = summary.committed;
        finished.skipped = summary.skipped;
        finished.failed = summary.failed;
        finished.bytes_fetched = summary.bytes_fetched;
        finished.cancelled = summary.was_cancelled;
        events->dispatch(finished);

        DF_LOG_INFO(*logger, log_category::coordinator,
            "Run finished: " + std::to_string(summary.committed) + " committed, " +
            std::to_string(summary.skipped) + " skipped, " +
            std::to_string(summary.failed) + " failed, " +
            std::to_string(summary.cancelled) + " cancelled, " +
            std::to_string(summary.bytes_fetched) + " bytes fetched");

        if (config.write_report) {
            auto written = summary.write_json(local_root / config.report_filename);
            if (!written) {
                DF_LOG_WARN(*logger, log_category::coordinator,
                    "Failed to write run report: " + written.error().message);
            }
        }
        return summary;
    }

    coordinator_config config;
    std::shared_ptr<remote_session> session;
    std::shared_ptr<fetch_logger> logger;
    std::shared_ptr<adapters::fetch_thread_pool_interface> pool;
    bool owns_pool;
    std::shared_ptr<path_filter> filter;
    std::shared_ptr<event_bus> events;
    chunk_planner planner;
    std::optional<session_info> session_details;
    std::atomic<bool> cancelled{false};
};

// ============================================================================
// transfer_coordinator::builder
// ============================================================================

transfer_coordinator::builder::builder() = default;

auto transfer_coordinator::builder::with_config(coordinator_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_coordinator::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto transfer_coordinator::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto transfer_coordinator::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto transfer_coordinator::builder::with_archive_policy(archive_policy policy) -> builder& {
    config_.archive = policy;
    return *this;
}

auto transfer_coordinator::builder::with_history_directory(std::filesystem::path dir)
    -> builder& {
    config_.history_directory = std::move(dir);
    return *this;
}

auto transfer_coordinator::builder::with_state_directory(std::filesystem::path dir)
    -> builder& {
    config_.state_directory = std::move(dir);
    return *this;
}

auto transfer_coordinator::builder::with_logger(std::shared_ptr<fetch_logger> logger)
    -> builder& {
    logger_ = std::move(logger);
    return *this;
}

auto transfer_coordinator::builder::with_thread_pool(
    std::shared_ptr<adapters::fetch_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_coordinator::builder::with_path_filter(std::shared_ptr<path_filter> filter)
    -> builder& {
    filter_ = std::move(filter);
    return *this;
}

auto transfer_coordinator::builder::with_observer(std::shared_ptr<fetch_observer> observer)
    -> builder& {
    observers_.push_back(std::move(observer));
    return *this;
}

auto transfer_coordinator::builder::build(std::shared_ptr<remote_session> session)
    -> result<transfer_coordinator> {
    if (!session) {
        return unexpected(error(error_code::invalid_configuration,
            "a remote session is required"));
    }
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    auto logger = logger_;
    if (logger) {
        logger->initialize();
    } else {
        logger = make_quiet_logger();
    }

    const bool owns_pool = !pool_;
    auto pool = pool_ ? pool_ : adapters::fetch_pool_factory::create(config_.worker_count);

    auto state = std::make_unique<impl>(
        config_, std::move(session), std::move(logger), std::move(pool), owns_pool, filter_);
    for (const auto& observer : observers_) {
        state->events->register_observer(observer);
    }
    return transfer_coordinator(std::move(state));
}

// ============================================================================
// transfer_coordinator
// ============================================================================

transfer_coordinator::transfer_coordinator(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {
}

transfer_coordinator::transfer_coordinator(transfer_coordinator&&) noexcept = default;

auto transfer_coordinator::operator=(transfer_coordinator&&) noexcept
    -> transfer_coordinator& = default;

transfer_coordinator::~transfer_coordinator() {
    if (impl_ && impl_->owns_pool && impl_->pool) {
        impl_->pool->shutdown();
    }
}

auto transfer_coordinator::authenticate() -> result<session_info> {
    return impl_->authenticate();
}

auto transfer_coordinator::list_contents(const std::string& remote_path)
    -> result<std::vector<remote_item>> {
    auto authenticated = impl_->ensure_authenticated();
    if (!authenticated) {
        return unexpected(authenticated.error());
    }
    return impl_->list_contents(remote_path);
}

auto transfer_coordinator::run(const std::string& remote_path,
                               const std::filesystem::path& local_root)
    -> result<run_summary> {
    return impl_->run(remote_path, local_root);
}

void transfer_coordinator::cancel() noexcept {
    impl_->cancelled.store(true, std::memory_order_release);
}

auto transfer_coordinator::is_cancelled() const -> bool {
    return impl_->cancelled.load(std::memory_order_acquire);
}

auto transfer_coordinator::events() -> event_bus& {
    return *impl_->events;
}

auto transfer_coordinator::config() const -> const coordinator_config& {
    return impl_->config;
}

}  // namespace kcenon::delta_fetch
