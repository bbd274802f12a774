/**
 * @file transfer_engine.h
 * @brief Sequential, resumable transfer queue
 */

#ifndef KCENON_DECK_BRIDGE_TRANSFER_TRANSFER_ENGINE_H
#define KCENON_DECK_BRIDGE_TRANSFER_TRANSFER_ENGINE_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "kcenon/deck_bridge/channel/secure_channel.h"
#include "kcenon/deck_bridge/config/bridge_config.h"
#include "kcenon/deck_bridge/core/types.h"
#include "kcenon/deck_bridge/transfer/transfer_types.h"

namespace kcenon::deck_bridge {

/**
 * @brief FIFO transfer queue driven by one worker thread
 *
 * At most one job is active. Jobs wait in queued status while the
 * channel_provider reports no channel. Every file is written to
 * "<destination>.tmp" and renamed into place once complete; an interrupted
 * job leaves the temp file behind and the next job for the same
 * destination resumes from its length.
 *
 * @code
 * auto engine = transfer_engine::builder()
 *     .with_channel_provider(manager)
 *     .build();
 *
 * auto id = engine.value().enqueue(
 *     transfer_request::upload("/home/me/game.iso", "/home/deck/game.iso"));
 * @endcode
 */
class transfer_engine {
public:
    using listener = std::function<void(const transfer_event&)>;

    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set transfer configuration (default: transfer_config{})
         */
        auto with_config(const transfer_config& config) -> builder&;

        /**
         * @brief Set the channel source (required)
         */
        auto with_channel_provider(std::shared_ptr<channel_provider> provider) -> builder&;

        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        transfer_config config_;
        std::shared_ptr<channel_provider> provider_;
    };

    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;
    ~transfer_engine();

    /**
     * @brief Append a job to the queue
     *
     * The remote path is validated here; a rejected path never reaches the
     * channel.
     *
     * @return path_traversal_rejected, invalid_configuration for empty
     *         paths, cancelled after shutdown()
     */
    [[nodiscard]] auto enqueue(const transfer_request& request) -> result<job_id>;

    /**
     * @brief Cancel one job
     *
     * A queued job ends immediately; an active job stops at the next chunk
     * boundary.
     *
     * @return job_not_found, or invalid_state_transition when the job has
     *         already ended
     */
    [[nodiscard]] auto cancel(job_id id) -> result<void>;

    /**
     * @brief Cancel the active job and drain the queue
     * @return Number of jobs cancelled
     */
    auto cancel_all() -> std::size_t;

    /**
     * @brief Answer overwrite_decision_needed for @p id
     * @return job_not_found, or invalid_state_transition when the job is
     *         not waiting for a decision
     */
    [[nodiscard]] auto answer_overwrite(job_id id, overwrite_decision decision) -> result<void>;

    [[nodiscard]] auto subscribe(listener fn) -> subscription_id;
    auto unsubscribe(subscription_id id) -> bool;

    /**
     * @brief Wait until every published event has reached the listeners
     */
    auto wait_for_events(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Finished jobs, oldest first
     */
    [[nodiscard]] auto history() const -> std::vector<transfer_job>;

    /**
     * @brief Drop finished jobs from history()
     */
    void clear_history();

    /**
     * @brief Queued, active and paused jobs in queue order
     */
    [[nodiscard]] auto pending() const -> std::vector<transfer_job>;

    [[nodiscard]] auto find(job_id id) const -> std::optional<transfer_job>;

    /**
     * @brief Block until job @p id reaches a terminal status
     * @return The final snapshot; timeout or job_not_found otherwise
     */
    [[nodiscard]] auto wait_for_job(job_id id, std::chrono::milliseconds timeout) const
        -> result<transfer_job>;

    /**
     * @brief Cancel everything and stop the worker
     *
     * Later enqueue() calls fail. Idempotent.
     */
    void shutdown();

    [[nodiscard]] auto config() const -> const transfer_config&;

private:
    transfer_engine(transfer_config config, std::shared_ptr<channel_provider> provider);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_TRANSFER_TRANSFER_ENGINE_H
