/**
 * @file chunk_scheduler.cpp
 * @brief Implementation of chunk_scheduler
 */

#include "kcenon/delta_fetch/engine/chunk_scheduler.h"
#include "kcenon/delta_fetch/core/error_codes.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>

namespace kcenon::delta_fetch {

namespace {

/**
 * @brief Shared state of one submitted file
 */
struct file_context {
    explicit file_context(file_job j) : job(std::move(j)) {}

    file_job job;
    std::mutex mutex;
    std::size_t remaining = 0;   ///< Tasks not yet terminal
    uint64_t committed_bytes = 0;
    std::size_t committed_chunks = 0;
    file_result result;
    std::atomic<bool> aborted{false};
    std::promise<file_result> promise;

    // Progress events wait here in commit order. At most one thread drains
    // the queue at a time, outside the state mutex.
    std::mutex progress_mutex;
    std::condition_variable progress_drained;
    std::deque<progress_event> progress_queue;
    bool draining = false;
};

enum class chunk_end {
    committed,
    failed,
    abandoned   ///< Never fetched: cancelled, file aborted, or dropped by the pool
};

}  // namespace

// ============================================================================
// chunk_scheduler::impl
// ============================================================================

class chunk_scheduler::impl : public std::enable_shared_from_this<chunk_scheduler::impl> {
public:
    /**
     * @brief One transfer_task in flight, shared by the pool closures that run it
     *
     * If the pool destroys the closure without running it, the destructor
     * settles the chunk as abandoned so the file's future still resolves.
     */
    class ticket : public std::enable_shared_from_this<ticket> {
    public:
        ticket(std::shared_ptr<impl> owner, std::shared_ptr<file_context> file, transfer_task task)
            : owner_(std::move(owner)), file_(std::move(file)), task_(std::move(task)) {}

        ~ticket() {
            if (settled_) {
                return;
            }
            try {
                owner_->settle(file_, task_, chunk_end::abandoned, 0, nullptr);
            } catch (const std::exception& e) {
                DF_LOG_ERROR(*owner_->logger_, log_category::scheduler,
                    std::string("Failed to settle dropped chunk task: ") + e.what());
            }
        }

        ticket(const ticket&) = delete;
        auto operator=(const ticket&) -> ticket& = delete;

        void run() {
            if (owner_->cancelled_.load(std::memory_order_acquire) ||
                file_->aborted.load(std::memory_order_acquire)) {
                abandon();
                return;
            }

            auto attempt = owner_->fetcher_->attempt(task_, file_->job.item, *file_->job.staging);
            switch (attempt.outcome) {
                case fetch_outcome::committed:
                    commit(attempt.bytes);
                    return;

                case fetch_outcome::retry_scheduled: {
                    {
                        std::lock_guard<std::mutex> lock(file_->mutex);
                        ++file_->result.retries;
                    }
                    if (owner_->cancelled_.load(std::memory_order_acquire)) {
                        abandon();
                        return;
                    }
                    auto self = shared_from_this();
                    owner_->pool_->submit_delayed([self]() { self->run(); }, attempt.retry_delay);
                    return;
                }

                case fetch_outcome::failed:
                    fail(attempt.err);
                    return;
            }
        }

    private:
        void commit(uint64_t bytes) {
            if (owner_->options_.sync_writes) {
                auto synced = file_->job.staging->sync();
                if (!synced) {
                    fail(synced.error());
                    return;
                }
            }

            auto committed = owner_->checkpoints_->commit(file_->job.destination, task_.chunk.offset);
            if (!committed) {
                fail(committed.error());
                return;
            }

            settled_ = true;
            owner_->settle(file_, task_, chunk_end::committed, bytes, nullptr);
        }

        void fail(const error& err) {
            settled_ = true;
            owner_->settle(file_, task_, chunk_end::failed, 0, &err);
        }

        void abandon() {
            settled_ = true;
            owner_->settle(file_, task_, chunk_end::abandoned, 0, nullptr);
        }

        std::shared_ptr<impl> owner_;
        std::shared_ptr<file_context> file_;
        transfer_task task_;
        bool settled_ = false;
    };

    impl(std::shared_ptr<adapters::fetch_thread_pool_interface> pool,
         std::shared_ptr<retrying_fetcher> fetcher,
         std::shared_ptr<checkpoint_store> checkpoints,
         std::shared_ptr<event_bus> events,
         scheduler_options options,
         std::shared_ptr<fetch_logger> logger)
        : pool_(std::move(pool))
        , fetcher_(std::move(fetcher))
        , checkpoints_(std::move(checkpoints))
        , events_(std::move(events))
        , options_(options)
        , logger_(logger ? std::move(logger) : make_quiet_logger()) {}

    void launch(const std::shared_ptr<file_context>& file, transfer_task task) {
        auto t = std::make_shared<ticket>(shared_from_this(), file, std::move(task));
        pool_->submit([t]() { t->run(); });
    }

    void settle(const std::shared_ptr<file_context>& file, const transfer_task& task,
                chunk_end how, uint64_t bytes, const error* err) {
        bool done = false;
        bool report_progress = false;
        {
            std::lock_guard<std::mutex> lock(file->mutex);
            auto& result = file->result;

            switch (how) {
                case chunk_end::committed:
                    result.plan.set_status(task.chunk.offset, chunk_status::committed);
                    ++result.chunks_fetched;
                    result.bytes_fetched += bytes;
                    ++file->committed_chunks;
                    file->committed_bytes += task.chunk.length;
                    if (events_) {
                        progress_event event;
                        event.item = file->job.item;
                        event.destination = file->job.destination;
                        event.bytes_committed = file->committed_bytes;
                        event.total_bytes = result.plan.file_size();
                        event.chunks_committed = file->committed_chunks;
                        event.chunks_total = result.plan.size();
                        // Queued under the state mutex so queue order is commit order
                        std::lock_guard<std::mutex> progress_lock(file->progress_mutex);
                        file->progress_queue.push_back(std::move(event));
                        report_progress = true;
                    }
                    break;

                case chunk_end::failed:
                    result.plan.set_status(task.chunk.offset, chunk_status::failed);
                    if (err) {
                        if (!result.first_error) {
                            result.first_error = *err;
                        }
                        if (classify(err->code) == error_kind::checksum_mismatch) {
                            result.content_changed = true;
                        }
                        if (err->code != error_code::retries_exhausted) {
                            file->aborted.store(true, std::memory_order_release);
                        }
                    }
                    break;

                case chunk_end::abandoned:
                    if (!file->aborted.load(std::memory_order_acquire)) {
                        result.cancelled = true;
                    }
                    break;
            }

            done = --file->remaining == 0;
        }

        if (report_progress) {
            drain_progress(file);
        }
        if (done) {
            finish(file);
        }
    }

    /**
     * @brief Dispatch queued progress events unless another thread already is
     */
    void drain_progress(const std::shared_ptr<file_context>& file) {
        std::unique_lock<std::mutex> lock(file->progress_mutex);
        if (file->draining) {
            return;
        }
        file->draining = true;
        while (!file->progress_queue.empty()) {
            auto event = std::move(file->progress_queue.front());
            file->progress_queue.pop_front();
            lock.unlock();
            try {
                events_->dispatch(event);
            } catch (const std::exception& e) {
                DF_LOG_ERROR(*logger_, log_category::scheduler,
                    std::string("Progress dispatch failed: ") + e.what());
            }
            lock.lock();
        }
        file->draining = false;
        file->progress_drained.notify_all();
    }

    void finish(const std::shared_ptr<file_context>& file) {
        {
            // No progress event of this file may trail its completion
            std::unique_lock<std::mutex> lock(file->progress_mutex);
            file->progress_drained.wait(lock, [&file]() {
                return !file->draining && file->progress_queue.empty();
            });
        }

        file_result result;
        {
            std::lock_guard<std::mutex> lock(file->mutex);
            file->result.aborted = file->aborted.load(std::memory_order_acquire);
            result = file->result;
        }
        active_files_.fetch_sub(1, std::memory_order_acq_rel);

        fetch_log_context ctx;
        ctx.remote_path = file->job.item.path;
        ctx.destination = file->job.destination.string();
        ctx.total_chunks = result.plan.size();
        ctx.bytes = result.bytes_fetched;
        ctx.outcome = result.plan.is_complete() ? "complete"
                    : result.aborted ? "aborted"
                    : result.cancelled ? "cancelled" : "incomplete";
        DF_LOG_DEBUG_CTX(*logger_, log_category::scheduler, "File tasks settled", ctx);

        file->promise.set_value(std::move(result));
    }

    std::shared_ptr<adapters::fetch_thread_pool_interface> pool_;
    std::shared_ptr<retrying_fetcher> fetcher_;
    std::shared_ptr<checkpoint_store> checkpoints_;
    std::shared_ptr<event_bus> events_;
    scheduler_options options_;
    std::shared_ptr<fetch_logger> logger_;

    std::atomic<bool> cancelled_{false};
    std::atomic<std::size_t> active_files_{0};
};

// ============================================================================
// chunk_scheduler
// ============================================================================

chunk_scheduler::chunk_scheduler(std::shared_ptr<adapters::fetch_thread_pool_interface> pool,
                                 std::shared_ptr<retrying_fetcher> fetcher,
                                 std::shared_ptr<checkpoint_store> checkpoints,
                                 std::shared_ptr<event_bus> events,
                                 scheduler_options options,
                                 std::shared_ptr<fetch_logger> logger)
    : impl_(std::make_shared<impl>(std::move(pool), std::move(fetcher), std::move(checkpoints),
                                   std::move(events), options, std::move(logger))) {
}

chunk_scheduler::~chunk_scheduler() {
    if (impl_) {
        impl_->cancelled_.store(true, std::memory_order_release);
    }
}

auto chunk_scheduler::submit_file(file_job job) -> std::shared_future<file_result> {
    auto file = std::make_shared<file_context>(std::move(job));
    file->result.plan = file->job.plan;
    file->committed_bytes = file->job.plan.committed_bytes();
    file->committed_chunks = file->job.plan.committed_count();
    auto future = file->promise.get_future().share();

    impl_->active_files_.fetch_add(1, std::memory_order_acq_rel);

    auto pending = file->job.plan.pending_chunks();
    if (pending.empty()) {
        impl_->finish(file);
        return future;
    }

    if (!file->job.staging || !file->job.staging->is_open()) {
        {
            std::lock_guard<std::mutex> lock(file->mutex);
            file->result.first_error = error(error_code::not_initialized,
                "no open staging file for " + file->job.destination.string());
        }
        file->aborted.store(true, std::memory_order_release);
        impl_->finish(file);
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(file->mutex);
        file->remaining = pending.size();
    }

    DF_LOG_DEBUG(*impl_->logger_, log_category::scheduler,
        "Scheduling " + std::to_string(pending.size()) + " of " +
        std::to_string(file->job.plan.size()) + " chunks for " + file->job.item.path);

    for (const auto& chunk : pending) {
        transfer_task task;
        task.destination = file->job.destination;
        task.chunk = chunk;
        impl_->launch(file, std::move(task));
    }
    return future;
}

void chunk_scheduler::cancel() {
    impl_->cancelled_.store(true, std::memory_order_release);
}

auto chunk_scheduler::is_cancelled() const -> bool {
    return impl_->cancelled_.load(std::memory_order_acquire);
}

auto chunk_scheduler::active_files() const -> std::size_t {
    return impl_->active_files_.load(std::memory_order_acquire);
}

}  // namespace kcenon::delta_fetch
