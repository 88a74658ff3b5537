// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for delta_fetch
 */

#include "kcenon/delta_fetch/adapters/thread_pool_adapter.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::delta_fetch::adapters {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

/**
 * @brief A task wrapped so that its outcome lands in a future
 *
 * Destroying run without calling it breaks the promise.
 */
struct tracked_task {
    std::function<void()> run;
    std::future<void> done;
};

auto make_tracked_task(std::function<void()> task) -> tracked_task {
    auto promise = std::make_shared<std::promise<void>>();
    tracked_task tracked;
    tracked.done = promise->get_future();
    tracked.run = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };
    return tracked;
}

/**
 * @brief Holds tasks until their due time, then hands them to a release sink
 *
 * One thread waits on the earliest due time; no pool worker is involved
 * until the task is released.
 */
class delay_timer {
public:
    using clock = std::chrono::steady_clock;
    using release_fn = std::function<void(std::function<void()>)>;

    explicit delay_timer(release_fn release)
        : release_(std::move(release))
        , thread_([this] { run(); }) {
    }

    ~delay_timer() { stop(); }

    delay_timer(const delay_timer&) = delete;
    delay_timer& operator=(const delay_timer&) = delete;

    void schedule(std::function<void()> task, std::chrono::milliseconds delay) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            entries_.push_back(entry{clock::now() + delay, next_sequence_++, std::move(task)});
            std::push_heap(entries_.begin(), entries_.end(), later);
        }
        cv_.notify_one();
    }

    void stop() {
        std::vector<entry> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            stopped_ = true;
            dropped.swap(entries_);
        }
        cv_.notify_all();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

    [[nodiscard]] size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct entry {
        clock::time_point due;
        uint64_t sequence;
        std::function<void()> task;
    };

    // Heap order: earliest due first, FIFO among equal due times.
    static bool later(const entry& a, const entry& b) {
        if (a.due != b.due) {
            return a.due > b.due;
        }
        return a.sequence > b.sequence;
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopped_) {
            if (entries_.empty()) {
                cv_.wait(lock);
                continue;
            }
            auto due = entries_.front().due;
            if (clock::now() < due) {
                cv_.wait_until(lock, due);
                continue;
            }
            std::pop_heap(entries_.begin(), entries_.end(), later);
            auto task = std::move(entries_.back().task);
            entries_.pop_back();

            lock.unlock();
            release_(std::move(task));
            lock.lock();
        }
    }

    release_fn release_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<entry> entries_;
    uint64_t next_sequence_ = 0;
    bool stopped_ = false;
    std::thread thread_;
};

}  // namespace

// ============================================================================
// bounded_thread_pool implementation
// ============================================================================

struct bounded_thread_pool::impl {
    std::string pool_name;
    size_t workers{0};

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> ready;
    bool running{true};

    std::atomic<size_t> active{0};
    std::atomic<size_t> peak{0};

    std::vector<std::thread> threads;
    std::unique_ptr<delay_timer> timer;

    void enqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!running) {
                return;
            }
            ready.push_back(std::move(task));
        }
        cv.notify_one();
    }

    void record_start() {
        auto now_active = active.fetch_add(1, std::memory_order_acq_rel) + 1;
        auto previous = peak.load(std::memory_order_relaxed);
        while (previous < now_active &&
               !peak.compare_exchange_weak(previous, now_active, std::memory_order_relaxed)) {
        }
    }

    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return !running || !ready.empty(); });
                if (!running) {
                    return;
                }
                task = std::move(ready.front());
                ready.pop_front();
            }

            record_start();
            task();
            active.fetch_sub(1, std::memory_order_acq_rel);
        }
    }
};

bounded_thread_pool::bounded_thread_pool(size_t worker_count, const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = pool_name;
    pimpl_->workers = std::max<size_t>(worker_count, 1);

    auto* state = pimpl_.get();
    pimpl_->timer = std::make_unique<delay_timer>(
        [state](std::function<void()> task) { state->enqueue(std::move(task)); });

    pimpl_->threads.reserve(pimpl_->workers);
    for (size_t i = 0; i < pimpl_->workers; ++i) {
        pimpl_->threads.emplace_back([state] { state->worker_loop(); });
    }
}

bounded_thread_pool::~bounded_thread_pool() {
    shutdown();
}

std::future<void> bounded_thread_pool::submit(std::function<void()> task) {
    auto tracked = make_tracked_task(std::move(task));
    pimpl_->enqueue(std::move(tracked.run));
    return std::move(tracked.done);
}

std::future<void> bounded_thread_pool::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto tracked = make_tracked_task(std::move(task));
    if (delay.count() <= 0) {
        pimpl_->enqueue(std::move(tracked.run));
    } else {
        pimpl_->timer->schedule(std::move(tracked.run), delay);
    }
    return std::move(tracked.done);
}

size_t bounded_thread_pool::worker_count() const {
    return pimpl_->workers;
}

bool bounded_thread_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->running;
}

size_t bounded_thread_pool::pending_tasks() const {
    size_t queued = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        queued = pimpl_->ready.size();
    }
    return queued + pimpl_->timer->pending();
}

void bounded_thread_pool::shutdown() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (!pimpl_->running) {
            return;
        }
        pimpl_->running = false;
        dropped.swap(pimpl_->ready);
    }
    pimpl_->timer->stop();
    pimpl_->cv.notify_all();

    auto self = std::this_thread::get_id();
    for (auto& thread : pimpl_->threads) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == self) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

size_t bounded_thread_pool::active_tasks() const {
    return pimpl_->active.load(std::memory_order_acquire);
}

size_t bounded_thread_pool::peak_concurrency() const {
    return pimpl_->peak.load(std::memory_order_acquire);
}

std::string bounded_thread_pool::pool_name() const {
    return pimpl_->pool_name;
}

// ============================================================================
// thread_system_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<bool> running{true};
    std::atomic<bool> shut_down{false};
    std::unique_ptr<delay_timer> timer;

    void enqueue(std::function<void()> task) {
        if (!running.load(std::memory_order_acquire)) {
            return;
        }
        auto job = std::make_unique<function_job>(std::move(task), "chunk_fetch");
        auto enqueue_result = pool->enqueue(std::move(job));
        if (!enqueue_result.is_ok()) {
            running.store(false, std::memory_order_release);
        }
    }
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;

    auto* state = pimpl_.get();
    pimpl_->timer = std::make_unique<delay_timer>(
        [state](std::function<void()> task) { state->enqueue(std::move(task)); });
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_pool_adapter>
thread_system_pool_adapter::create_default(size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    auto started = pool->start();
    if (!started.is_ok()) {
        return nullptr;
    }

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    auto tracked = make_tracked_task(std::move(task));
    pimpl_->enqueue(std::move(tracked.run));
    return std::move(tracked.done);
}

std::future<void> thread_system_pool_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto tracked = make_tracked_task(std::move(task));
    if (delay.count() <= 0) {
        pimpl_->enqueue(std::move(tracked.run));
    } else {
        pimpl_->timer->schedule(std::move(tracked.run), delay);
    }
    return std::move(tracked.done);
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr && pimpl_->running.load(std::memory_order_acquire);
}

size_t thread_system_pool_adapter::pending_tasks() const {
    size_t queued = 0;
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        queued = queue ? queue->size() : 0;
    }
    return queued + pimpl_->timer->pending();
}

void thread_system_pool_adapter::shutdown() {
    pimpl_->running.store(false, std::memory_order_release);
    if (pimpl_->shut_down.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pimpl_->timer->stop();
    if (pimpl_->pool) {
        pimpl_->pool->stop(true);
    }
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_pool_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// fetch_pool_factory implementation
// ============================================================================

std::shared_ptr<fetch_thread_pool_interface> fetch_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    if (auto adapter = thread_system_pool_adapter::create_default(worker_count, pool_name)) {
        return adapter;
    }
#endif
    return std::make_shared<bounded_thread_pool>(worker_count, pool_name);
}

}  // namespace kcenon::delta_fetch::adapters
