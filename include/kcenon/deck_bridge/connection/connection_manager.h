/**
 * @file connection_manager.h
 * @brief Lifecycle of the one active secure_channel
 */

#ifndef KCENON_DECK_BRIDGE_CONNECTION_CONNECTION_MANAGER_H
#define KCENON_DECK_BRIDGE_CONNECTION_CONNECTION_MANAGER_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/deck_bridge/channel/secure_channel.h"
#include "kcenon/deck_bridge/config/bridge_config.h"
#include "kcenon/deck_bridge/connection/connection_types.h"
#include "kcenon/deck_bridge/connection/secret_store.h"
#include "kcenon/deck_bridge/core/types.h"
#include "kcenon/deck_bridge/discovery/discovery_types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Connect, keep alive, reconnect with backoff, disconnect
 *
 * All network work runs on a supervisor pool; connect() and disconnect()
 * return without waiting for it. State changes follow
 * is_transition_allowed() and are published to subscribers in order.
 *
 * The manager owns the channel. use_channel() is the only way to reach it
 * and serializes every caller behind one lock.
 *
 * @code
 * auto manager = connection_manager::builder()
 *     .with_connector(std::make_shared<sftp_connector>())
 *     .with_secret_store(keyring)
 *     .build();
 *
 * manager.value()->subscribe([](const connection_event& e) { ... });
 * (void)manager.value()->connect(dev, credentials{});
 * @endcode
 */
class connection_manager : public channel_provider {
public:
    using listener = std::function<void(const connection_event&)>;

    /**
     * @brief Builder for connection_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set connection configuration (default: connection_config{})
         */
        auto with_config(const connection_config& config) -> builder&;

        /**
         * @brief Set the channel factory (required)
         */
        auto with_connector(std::shared_ptr<channel_connector> connector) -> builder&;

        /**
         * @brief Set the password source (default: empty memory_secret_store)
         */
        auto with_secret_store(std::shared_ptr<secret_store> secrets) -> builder&;

        /**
         * @brief Build the manager
         * @return invalid_configuration when the connector is missing or the
         *         configuration does not validate
         */
        [[nodiscard]] auto build() -> result<std::shared_ptr<connection_manager>>;

    private:
        connection_config config_;
        std::shared_ptr<channel_connector> connector_;
        std::shared_ptr<secret_store> secrets_;
    };

    connection_manager(const connection_manager&) = delete;
    auto operator=(const connection_manager&) -> connection_manager& = delete;
    ~connection_manager() override;

    /**
     * @brief Start connecting to @p target
     *
     * Resolves credentials, moves to connecting and returns. The outcome
     * arrives as state_changed events. Allowed from disconnected and error;
     * a connect from error starts a fresh retry cycle.
     *
     * @return authentication_failure when no key or password is available,
     *         invalid_state_transition while connecting or connected
     */
    [[nodiscard]] auto connect(const device& target, const credentials& creds) -> result<void>;

    /**
     * @brief Close the channel and stop all background work
     *
     * A network call in progress finishes first; no reconnect fires after
     * this returns. No-op when already disconnected.
     */
    [[nodiscard]] auto disconnect() -> result<void>;

    [[nodiscard]] auto current_state() const -> connection_state;

    /**
     * @brief Answer the pending host_trust_needed question
     * @return invalid_state_transition when no question is pending
     */
    [[nodiscard]] auto answer_host_trust(trust_decision decision) -> result<void>;

    /**
     * @brief Block until current_state() == @p state
     * @return false on timeout
     */
    [[nodiscard]] auto wait_for_state(connection_state state,
                                      std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief List a remote directory through the active channel
     */
    [[nodiscard]] auto list_directory(const std::string& path)
        -> result<std::vector<remote_entry>>;

    [[nodiscard]] auto subscribe(listener fn) -> subscription_id;
    auto unsubscribe(subscription_id id) -> bool;

    /**
     * @brief Wait until every published event has reached the listeners
     */
    auto wait_for_events(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto config() const -> const connection_config&;

    // channel_provider
    [[nodiscard]] auto is_channel_available() const -> bool override;

    /**
     * @brief Run @p operation on the channel under the channel lock
     *
     * A connection-loss error from the operation (or a channel found
     * closed) moves the manager from connected to connecting and starts
     * the reconnect cycle.
     */
    [[nodiscard]] auto use_channel(const std::function<result<void>(secure_channel&)>& operation)
        -> result<void> override;

private:
    connection_manager(connection_config config,
                       std::shared_ptr<channel_connector> connector,
                       std::shared_ptr<secret_store> secrets);

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Existing default private keys, in preference order
 *
 * ~/.ssh/id_ed25519 then ~/.ssh/id_rsa.
 */
[[nodiscard]] auto default_key_candidates() -> std::vector<std::string>;

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CONNECTION_CONNECTION_MANAGER_H
