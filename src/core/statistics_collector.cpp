/**
 * @file statistics_collector.cpp
 * @brief Implementation of sliding-window transfer statistics
 */

#include "kcenon/deck_bridge/core/statistics_collector.h"

#include <deque>
#include <mutex>

namespace kcenon::deck_bridge {

/**
 * @brief Cumulative byte count observed at one instant
 */
struct rate_sample {
    time_point timestamp;
    uint64_t bytes;
};

struct statistics_collector::impl {
    config cfg;

    mutable std::mutex mutex;
    bool active{false};
    time_point start_time{};
    time_point last_time{};
    uint64_t initial_bytes{0};
    uint64_t bytes_transferred{0};
    uint64_t chunks_transferred{0};
    std::optional<uint64_t> total_bytes;
    std::deque<rate_sample> samples;

    impl() : cfg{} {}
    explicit impl(config c) : cfg(c) {
        if (cfg.rate_window_size < 2) {
            cfg.rate_window_size = 2;
        }
    }

    [[nodiscard]] auto window_rate() const -> double {
        if (samples.size() < 2) {
            return 0.0;
        }

        const auto& oldest = samples.front();
        const auto& newest = samples.back();

        auto time_diff = std::chrono::duration_cast<std::chrono::microseconds>(
            newest.timestamp - oldest.timestamp);
        if (time_diff.count() <= 0) {
            return 0.0;
        }

        auto bytes_diff = newest.bytes - oldest.bytes;
        return static_cast<double>(bytes_diff) * 1'000'000.0 /
               static_cast<double>(time_diff.count());
    }

    [[nodiscard]] auto average_rate() const -> double {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            last_time - start_time);
        if (elapsed.count() <= 0) {
            return 0.0;
        }
        return static_cast<double>(bytes_transferred - initial_bytes) * 1'000'000.0 /
               static_cast<double>(elapsed.count());
    }

    [[nodiscard]] auto eta() const -> std::optional<duration> {
        if (!total_bytes) {
            return std::nullopt;
        }
        if (bytes_transferred >= *total_bytes) {
            return duration{0};
        }

        double rate = window_rate();
        if (rate <= 0.0) {
            return std::nullopt;
        }

        uint64_t remaining = *total_bytes - bytes_transferred;
        return duration{static_cast<int64_t>(static_cast<double>(remaining) * 1000.0 / rate)};
    }
};

statistics_collector::statistics_collector()
    : impl_(std::make_unique<impl>()) {}

statistics_collector::statistics_collector(config cfg)
    : impl_(std::make_unique<impl>(cfg)) {}

statistics_collector::statistics_collector(statistics_collector&&) noexcept = default;
auto statistics_collector::operator=(statistics_collector&&) noexcept
    -> statistics_collector& = default;
statistics_collector::~statistics_collector() = default;

void statistics_collector::start(std::optional<uint64_t> total_bytes, uint64_t initial_bytes) {
    start(total_bytes, initial_bytes, std::chrono::steady_clock::now());
}

void statistics_collector::start(std::optional<uint64_t> total_bytes,
                                 uint64_t initial_bytes,
                                 time_point at) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->active = true;
    impl_->start_time = at;
    impl_->last_time = at;
    impl_->initial_bytes = initial_bytes;
    impl_->bytes_transferred = initial_bytes;
    impl_->chunks_transferred = 0;
    impl_->total_bytes = total_bytes;
    impl_->samples.clear();
    impl_->samples.push_back({at, initial_bytes});
}

void statistics_collector::stop() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->active = false;
}

void statistics_collector::reset() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->active = false;
    impl_->initial_bytes = 0;
    impl_->bytes_transferred = 0;
    impl_->chunks_transferred = 0;
    impl_->total_bytes.reset();
    impl_->samples.clear();
}

auto statistics_collector::is_active() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->active;
}

void statistics_collector::record_chunk(uint64_t bytes) {
    record_chunk(bytes, std::chrono::steady_clock::now());
}

void statistics_collector::record_chunk(uint64_t bytes, time_point at) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->bytes_transferred += bytes;
    impl_->chunks_transferred += 1;
    impl_->last_time = at;

    impl_->samples.push_back({at, impl_->bytes_transferred});
    while (impl_->samples.size() > impl_->cfg.rate_window_size) {
        impl_->samples.pop_front();
    }
}

auto statistics_collector::get_transfer_rate() const -> double {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->window_rate();
}

auto statistics_collector::get_average_rate() const -> double {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->average_rate();
}

auto statistics_collector::get_eta() const -> std::optional<duration> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->eta();
}

auto statistics_collector::get_elapsed() const -> duration {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return std::chrono::duration_cast<duration>(impl_->last_time - impl_->start_time);
}

auto statistics_collector::get_completion_percentage() const -> std::optional<double> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->total_bytes) {
        return std::nullopt;
    }
    if (*impl_->total_bytes == 0) {
        return 100.0;
    }
    return static_cast<double>(impl_->bytes_transferred) /
           static_cast<double>(*impl_->total_bytes) * 100.0;
}

auto statistics_collector::get_bytes_transferred() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bytes_transferred;
}

auto statistics_collector::get_chunks_transferred() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->chunks_transferred;
}

auto statistics_collector::get_snapshot() const -> snapshot {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    snapshot s;
    s.bytes_transferred = impl_->bytes_transferred;
    s.total_bytes = impl_->total_bytes;
    s.chunks_transferred = impl_->chunks_transferred;
    s.current_rate = impl_->window_rate();
    s.average_rate = impl_->average_rate();
    s.elapsed = std::chrono::duration_cast<duration>(impl_->last_time - impl_->start_time);
    s.estimated_remaining = impl_->eta();
    return s;
}

void statistics_collector::set_total_bytes(std::optional<uint64_t> total_bytes) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->total_bytes = total_bytes;
}

}  // namespace kcenon::deck_bridge
