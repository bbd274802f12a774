/**
 * @file discovery_engine.h
 * @brief Finds SSH-reachable devices on the local network
 */

#ifndef KCENON_DECK_BRIDGE_DISCOVERY_DISCOVERY_ENGINE_H
#define KCENON_DECK_BRIDGE_DISCOVERY_DISCOVERY_ENGINE_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "kcenon/deck_bridge/config/bridge_config.h"
#include "kcenon/deck_bridge/core/types.h"
#include "kcenon/deck_bridge/discovery/discovery_types.h"
#include "kcenon/deck_bridge/discovery/network_prober.h"

namespace kcenon::deck_bridge {

/**
 * @brief One running (or finished) discovery
 *
 * Devices become available as soon as they are confirmed. next() hands
 * them out one at a time; devices() returns everything emitted so far.
 * A name learned later (mDNS or PTR) renames the entry in place and is
 * announced with device_updated.
 *
 * @code
 * auto run = engine.discover();
 * while (auto dev = run.value()->next(std::chrono::seconds(1))) {
 *     show(*dev);
 * }
 * @endcode
 *
 * Destroying the last reference cancels the run and waits for its
 * coordinator thread.
 */
class discovery_run {
public:
    struct impl;

    explicit discovery_run(std::unique_ptr<impl> state);
    ~discovery_run();

    discovery_run(const discovery_run&) = delete;
    auto operator=(const discovery_run&) -> discovery_run& = delete;

    /**
     * @brief Next device not yet handed out
     *
     * Waits up to @p wait. Returns std::nullopt when nothing arrived in
     * time or when the run has finished and every device was handed out;
     * is_finished() tells the two apart.
     */
    [[nodiscard]] auto next(std::chrono::milliseconds wait) -> std::optional<device>;

    /**
     * @brief Stop the run without waiting for outstanding probes
     *
     * Queued probes never start; in-flight probes are abandoned and their
     * results discarded. discovery_complete is published with
     * cancelled = true.
     */
    void cancel();

    [[nodiscard]] auto is_finished() const -> bool;

    /**
     * @brief Block until the run finishes
     * @return false if @p timeout passed first
     */
    [[nodiscard]] auto wait_until_finished(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Every device emitted so far, in emission order
     */
    [[nodiscard]] auto devices() const -> std::vector<device>;

    /**
     * @brief Summary once finished; std::nullopt while running
     *
     * An error (error_code::no_network) means discovery could not start,
     * which is distinct from a summary with device_count == 0.
     */
    [[nodiscard]] auto outcome() const -> std::optional<result<discovery_summary>>;

private:
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Device discovery over mDNS and a /24 port scan
 *
 * The well-known name lookup and the subnet scan run concurrently on a
 * worker pool bounded by discovery_config::max_workers. Only
 * discovery_config::port is ever probed. One run at a time.
 *
 * @code
 * auto engine = discovery_engine::builder().build();
 * auto id = engine.value().subscribe([](const discovery_event& e) { ... });
 * auto run = engine.value().discover();
 * @endcode
 */
class discovery_engine {
public:
    using listener = std::function<void(const discovery_event&)>;

    /**
     * @brief Builder for discovery_engine
     */
    class builder {
    public:
        builder();

        auto with_config(const discovery_config& config) -> builder&;

        /**
         * @brief Replace the POSIX prober (default: system_prober)
         */
        auto with_prober(std::shared_ptr<network_prober> prober) -> builder&;

        [[nodiscard]] auto build() -> result<discovery_engine>;

    private:
        discovery_config config_;
        std::shared_ptr<network_prober> prober_;
    };

    discovery_engine(const discovery_engine&) = delete;
    auto operator=(const discovery_engine&) -> discovery_engine& = delete;
    discovery_engine(discovery_engine&&) noexcept;
    auto operator=(discovery_engine&&) noexcept -> discovery_engine&;
    ~discovery_engine();

    /**
     * @brief Start a discovery run
     * @param timeout_hint Upper bound for the whole run; zero means the run
     *        ends when every probe has answered or timed out
     * @return error_code::invalid_state_transition while a run is active
     */
    [[nodiscard]] auto discover(std::chrono::milliseconds timeout_hint = std::chrono::milliseconds{0})
        -> result<std::shared_ptr<discovery_run>>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto subscribe(listener fn) -> subscription_id;
    auto unsubscribe(subscription_id id) -> bool;

    /**
     * @brief Wait until every published event has reached the listeners
     */
    auto wait_for_events(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto config() const -> const discovery_config&;

private:
    discovery_engine(discovery_config config, std::shared_ptr<network_prober> prober);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_DISCOVERY_DISCOVERY_ENGINE_H
