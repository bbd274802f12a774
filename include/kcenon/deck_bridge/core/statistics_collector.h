/**
 * @file statistics_collector.h
 * @brief Sliding-window speed and ETA tracking for a transfer job
 *
 * One collector follows one job. The transfer loop records one sample per
 * chunk; speed is derived from the oldest and newest sample in the window,
 * ETA from the remaining bytes and that speed.
 */

#ifndef KCENON_DECK_BRIDGE_CORE_STATISTICS_COLLECTOR_H
#define KCENON_DECK_BRIDGE_CORE_STATISTICS_COLLECTOR_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace kcenon::deck_bridge {

using duration = std::chrono::milliseconds;
using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Statistics collector for transfer progress monitoring
 *
 * Thread-safe: the engine worker records while callers read snapshots.
 *
 * @code
 * statistics_collector stats;
 * stats.start(total_bytes, resume_offset);
 *
 * // After each chunk
 * stats.record_chunk(chunk_size);
 *
 * auto speed = stats.get_transfer_rate();
 * auto eta = stats.get_eta();   // std::nullopt while indeterminate
 * @endcode
 */
class statistics_collector {
public:
    struct config {
        std::size_t rate_window_size = 10;  ///< Number of chunk samples in the window
    };

    struct snapshot {
        uint64_t bytes_transferred = 0;
        std::optional<uint64_t> total_bytes;
        uint64_t chunks_transferred = 0;
        double current_rate = 0.0;                ///< bytes/sec over the window
        double average_rate = 0.0;                ///< bytes/sec since start
        duration elapsed{0};
        std::optional<duration> estimated_remaining;
    };

    statistics_collector();
    explicit statistics_collector(config cfg);

    statistics_collector(const statistics_collector&) = delete;
    auto operator=(const statistics_collector&) -> statistics_collector& = delete;
    statistics_collector(statistics_collector&&) noexcept;
    auto operator=(statistics_collector&&) noexcept -> statistics_collector&;

    ~statistics_collector();

    /**
     * @brief Begin a new measurement
     * @param total_bytes Expected size, std::nullopt when unknown
     * @param initial_bytes Bytes already present (resume offset)
     */
    void start(std::optional<uint64_t> total_bytes, uint64_t initial_bytes = 0);

    /**
     * @brief Begin a new measurement at an explicit instant
     */
    void start(std::optional<uint64_t> total_bytes, uint64_t initial_bytes, time_point at);

    void stop();

    void reset();

    [[nodiscard]] auto is_active() const noexcept -> bool;

    /**
     * @brief Record one completed chunk of @p bytes
     */
    void record_chunk(uint64_t bytes);

    /**
     * @brief Record one completed chunk at an explicit instant
     */
    void record_chunk(uint64_t bytes, time_point at);

    /**
     * @brief Current rate in bytes per second over the sample window
     *
     * Zero until the window holds two samples separated in time.
     */
    [[nodiscard]] auto get_transfer_rate() const -> double;

    [[nodiscard]] auto get_average_rate() const -> double;

    /**
     * @brief Estimated time remaining
     * @return std::nullopt when the total is unknown or the rate is zero
     */
    [[nodiscard]] auto get_eta() const -> std::optional<duration>;

    [[nodiscard]] auto get_elapsed() const -> duration;

    /**
     * @brief Percentage complete, std::nullopt when the total is unknown
     */
    [[nodiscard]] auto get_completion_percentage() const -> std::optional<double>;

    [[nodiscard]] auto get_bytes_transferred() const -> uint64_t;

    [[nodiscard]] auto get_chunks_transferred() const -> uint64_t;

    [[nodiscard]] auto get_snapshot() const -> snapshot;

    void set_total_bytes(std::optional<uint64_t> total_bytes);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CORE_STATISTICS_COLLECTOR_H
