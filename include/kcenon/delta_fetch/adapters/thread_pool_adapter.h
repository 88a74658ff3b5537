// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for chunk fetch tasks
 *
 * Features:
 * - A bounded pool of W workers sharing one ready queue
 * - Delayed submission for retry backoff, kept in a due-time queue that
 *   occupies no worker while waiting
 * - Optional thread_system backend when built with BUILD_WITH_THREAD_SYSTEM
 *
 * A task the pool never runs (dropped by shutdown(), or submitted after it)
 * is destroyed without being invoked and its future reports
 * std::future_errc::broken_promise.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::delta_fetch::adapters {

/**
 * @brief Interface for the pool that executes chunk fetch tasks
 */
class fetch_thread_pool_interface {
public:
    virtual ~fetch_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task that becomes runnable after delay
     * @param task The task to execute
     * @param delay Time to wait before the task is queued
     * @return Future for the task completion
     */
    virtual std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts work
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks queued or waiting on a delay, not yet started
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Stop the workers and drop every task that has not started
     *
     * Running tasks are allowed to finish. Idempotent.
     */
    virtual void shutdown() = 0;
};

/**
 * @brief Fixed-size pool with a ready queue and a delay queue
 *
 * At most worker_count tasks run at any instant. Delayed tasks wait in a
 * due-time ordered queue serviced by a timer thread and move to the ready
 * queue when due.
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class bounded_thread_pool : public fetch_thread_pool_interface {
public:
    /**
     * @brief Start worker_count workers (at least one)
     */
    explicit bounded_thread_pool(size_t worker_count,
                                 const std::string& pool_name = "delta_fetch_pool");

    /**
     * @brief Destructor, calls shutdown()
     */
    ~bounded_thread_pool() override;

    bounded_thread_pool(const bounded_thread_pool&) = delete;
    bounded_thread_pool& operator=(const bounded_thread_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

    /**
     * @brief Tasks executing right now
     */
    [[nodiscard]] size_t active_tasks() const;

    /**
     * @brief Highest number of tasks that ever ran at the same time
     */
    [[nodiscard]] size_t peak_concurrency() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs fetch tasks on a thread_system thread_pool
 *
 * Delayed tasks are held by the adapter's own timer and enqueued into the
 * thread_system pool when due.
 */
class thread_system_pool_adapter : public fetch_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing, started thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "delta_fetch_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a pool with worker_count workers and wrap it
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "delta_fetch_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Picks the pool implementation for the current build
 */
class fetch_pool_factory {
public:
    /**
     * @brief Create a pool of worker_count workers
     *
     * Uses thread_system when available, bounded_thread_pool otherwise.
     */
    [[nodiscard]] static std::shared_ptr<fetch_thread_pool_interface> create(
        size_t worker_count,
        const std::string& pool_name = "delta_fetch_pool");
};

}  // namespace kcenon::delta_fetch::adapters
