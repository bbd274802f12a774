// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation for deck_bridge
 */

#include "kcenon/deck_bridge/adapters/thread_pool_adapter.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::deck_bridge::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto default_worker_count(size_t requested) -> size_t {
    if (requested != 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

auto stopped_future() -> std::future<void> {
    std::promise<void> promise;
    promise.set_exception(
        std::make_exception_ptr(std::runtime_error("worker pool is stopped")));
    return promise.get_future();
}

}  // namespace

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
    std::atomic<size_t> pending{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_pool_adapter>
thread_system_pool_adapter::create_default(size_t worker_count,
                                           const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name,
                                                        worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    return submit_to_stage(std::move(task), std::string{});
}

std::future<void> thread_system_pool_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    if (!pimpl_->running.load()) {
        return stopped_future();
    }

    pimpl_->pending.fetch_add(1);
    if (!stage_name.empty()) {
        pimpl_->tracker.increment(stage_name);
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The adapter joins its pool before it is destroyed, so impl outlives tasks.
    auto* state = pimpl_.get();
    auto wrapped_task = [task = std::move(task), promise, state, stage = stage_name]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (!stage.empty()) {
            state->tracker.decrement(stage);
        }
        state->pending.fetch_sub(1);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task),
                                              stage_name.empty() ? "bridge_task" : stage_name);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

void thread_system_pool_adapter::shutdown() {
    if (!pimpl_->running.exchange(false)) {
        return;
    }
    // thread_pool's destructor stops and joins its workers.
    pimpl_->pool.reset();
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->running.load();
}

size_t thread_system_pool_adapter::pending_tasks() const {
    return pimpl_->pending.load();
}

size_t thread_system_pool_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::string thread_system_pool_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// fixed_worker_pool implementation
// ============================================================================

struct fixed_worker_pool::impl {
    std::string pool_name;
    size_t worker_count{0};

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    bool stopping{false};
    std::vector<std::thread> workers;

    std::atomic<size_t> pending{0};
    std::atomic<size_t> running_now{0};
    std::atomic<size_t> peak{0};
    stage_tracker tracker;

    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }

            auto now = running_now.fetch_add(1) + 1;
            auto seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }

            task();

            running_now.fetch_sub(1);
        }
    }
};

fixed_worker_pool::fixed_worker_pool(size_t worker_count, const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = default_worker_count(worker_count);
    pimpl_->workers.reserve(pimpl_->worker_count);
    for (size_t i = 0; i < pimpl_->worker_count; ++i) {
        pimpl_->workers.emplace_back([state = pimpl_.get()] { state->worker_loop(); });
    }
}

fixed_worker_pool::~fixed_worker_pool() {
    shutdown();
}

std::future<void> fixed_worker_pool::submit(std::function<void()> task) {
    return submit_to_stage(std::move(task), std::string{});
}

std::future<void> fixed_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* state = pimpl_.get();
    auto wrapped_task = [task = std::move(task), promise, state, stage = stage_name]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (!stage.empty()) {
            state->tracker.decrement(stage);
        }
        state->pending.fetch_sub(1);
    };

    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return stopped_future();
        }
        pimpl_->pending.fetch_add(1);
        if (!stage_name.empty()) {
            pimpl_->tracker.increment(stage_name);
        }
        pimpl_->queue.push_back(std::move(wrapped_task));
    }
    pimpl_->cv.notify_one();

    return future;
}

void fixed_worker_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();

    for (auto& worker : pimpl_->workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        } else if (worker.joinable()) {
            worker.detach();
        }
    }
}

size_t fixed_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool fixed_worker_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t fixed_worker_pool::pending_tasks() const {
    return pimpl_->pending.load();
}

size_t fixed_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

size_t fixed_worker_pool::peak_concurrency() const {
    return pimpl_->peak.load();
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    return std::make_shared<fixed_worker_pool>(worker_count, pool_name);
#endif
}

}  // namespace kcenon::deck_bridge::adapters
