/**
 * @file event_queue.h
 * @brief Thread-safe event queue and fire-and-forget event dispatcher
 *
 * Engine components never call listeners on their own worker threads.
 * They publish into an event_dispatcher, whose dispatch thread delivers
 * events to every subscriber in publication order.
 */

#ifndef KCENON_DECK_BRIDGE_CORE_EVENT_QUEUE_H
#define KCENON_DECK_BRIDGE_CORE_EVENT_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Unbounded multi-producer queue with blocking and timed pops
 *
 * Once closed, pushes are ignored and pops drain what is left, then return
 * std::nullopt.
 */
template <typename T>
class event_queue {
public:
    event_queue() = default;

    event_queue(const event_queue&) = delete;
    event_queue& operator=(const event_queue&) = delete;

    /**
     * @return false when the queue is already closed
     */
    auto push(T item) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    [[nodiscard]] auto try_pop() -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    /**
     * @brief Wait up to @p timeout for an item
     */
    [[nodiscard]] auto wait_pop(std::chrono::milliseconds timeout) -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return pop_locked();
    }

    /**
     * @brief Wait until an item arrives or the queue is closed and drained
     */
    [[nodiscard]] auto wait_pop() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief True once closed and every item has been popped
     */
    [[nodiscard]] auto is_drained() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && items_.empty();
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    auto pop_locked() -> std::optional<T> {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_{false};
};

/**
 * @brief Delivers events to subscribers on a dedicated dispatch thread
 *
 * publish() never blocks on listeners. Listeners run one at a time, in
 * publication order, and an exception thrown by one listener is logged and
 * does not prevent delivery to the others.
 */
template <typename Event>
class event_dispatcher {
public:
    using listener = std::function<void(const Event&)>;

    explicit event_dispatcher(std::string name)
        : name_(std::move(name)), thread_([this] { dispatch_loop(); }) {}

    ~event_dispatcher() { stop(); }

    event_dispatcher(const event_dispatcher&) = delete;
    event_dispatcher& operator=(const event_dispatcher&) = delete;

    [[nodiscard]] auto subscribe(listener fn) -> subscription_id {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        auto id = ++next_id_;
        listeners_.emplace(id, std::move(fn));
        return id;
    }

    auto unsubscribe(subscription_id id) -> bool {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        return listeners_.erase(id) > 0;
    }

    void publish(Event event) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++published_;
        }
        if (!queue_.push(std::move(event))) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            --published_;
        }
    }

    /**
     * @brief Block until every event published so far has been delivered
     * @return false on timeout
     */
    auto wait_idle(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(state_mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return delivered_ == published_; });
    }

    /**
     * @brief Deliver what is queued, then join the dispatch thread
     */
    void stop() {
        queue_.close();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

private:
    void dispatch_loop() {
        while (auto event = queue_.wait_pop()) {
            std::map<subscription_id, listener> snapshot;
            {
                std::lock_guard<std::mutex> lock(listeners_mutex_);
                snapshot = listeners_;
            }

            for (auto& [id, fn] : snapshot) {
                try {
                    fn(*event);
                } catch (const std::exception& e) {
                    DB_LOG_ERROR(log_category::events,
                                 name_ + " listener " + std::to_string(id) +
                                     " threw: " + e.what());
                } catch (...) {
                    DB_LOG_ERROR(log_category::events,
                                 name_ + " listener " + std::to_string(id) +
                                     " threw a non-standard exception");
                }
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                ++delivered_;
            }
            idle_cv_.notify_all();
        }
    }

    std::string name_;
    event_queue<Event> queue_;

    std::mutex listeners_mutex_;
    std::map<subscription_id, listener> listeners_;
    subscription_id next_id_{0};

    std::mutex state_mutex_;
    std::condition_variable idle_cv_;
    uint64_t published_{0};
    uint64_t delivered_{0};

    std::thread thread_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CORE_EVENT_QUEUE_H
