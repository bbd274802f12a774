// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for deck_bridge
 *
 * Provides a single pool interface for the discovery probe pool and the
 * connection supervisor, backed by thread_system when available and by a
 * bounded std::thread pool otherwise.
 *
 * Features:
 * - Hard upper bound on concurrently running tasks (worker count)
 * - Stage-based task tracking ("mdns", "port_probe", "connect_cycle", ...)
 * - Orderly shutdown that joins every worker
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "kcenon/deck_bridge/config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::deck_bridge::adapters {

/**
 * @brief Interface for worker pool operations in deck_bridge
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion; exceptions thrown by the task
     *         are stored in it
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task tagged with a stage name for tracking
     * @param task The task to execute
     * @param stage_name Stage label, e.g. "port_probe"
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Stop accepting work and join the workers
     *
     * Tasks already queued still run. Idempotent.
     */
    virtual void shutdown() = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Tasks of one stage submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public worker_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "deck_bridge_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count,
        const std::string& pool_name = "deck_bridge_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;
    void shutdown() override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Bounded pool of std::thread workers sharing one FIFO task queue
 *
 * At most worker_count() tasks run at the same time; the rest wait in the
 * queue. The destructor calls shutdown().
 */
class fixed_worker_pool : public worker_pool_interface {
public:
    explicit fixed_worker_pool(size_t worker_count,
                               const std::string& pool_name = "deck_bridge_pool");
    ~fixed_worker_pool() override;

    fixed_worker_pool(const fixed_worker_pool&) = delete;
    fixed_worker_pool& operator=(const fixed_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;
    void shutdown() override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    /**
     * @brief Highest number of tasks observed running at the same time
     */
    [[nodiscard]] size_t peak_concurrency() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the best available worker pool
 *
 * 1. thread_system_pool_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. fixed_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @brief Create a pool
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "deck_bridge_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::deck_bridge::adapters
