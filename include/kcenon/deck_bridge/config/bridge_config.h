/**
 * @file bridge_config.h
 * @brief Engine configuration with defaults and validation
 *
 * Plain structs consumed by discovery_engine, connection_manager and
 * transfer_engine. Loading and saving them is left to the embedding
 * application; bridge_config::builder validates what it is given.
 */

#ifndef KCENON_DECK_BRIDGE_CONFIG_BRIDGE_CONFIG_H
#define KCENON_DECK_BRIDGE_CONFIG_BRIDGE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Reconnection policy configuration
 */
struct reconnect_policy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{2000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Wait before retry number @p attempt (1-based)
     *
     * initial_delay * multiplier^(attempt - 1), capped at max_delay.
     */
    [[nodiscard]] auto delay_for_attempt(std::size_t attempt) const -> std::chrono::milliseconds;
};

struct discovery_config {
    std::string mdns_hostname = "steamdeck.local";
    std::chrono::milliseconds mdns_timeout{2000};
    std::chrono::milliseconds probe_timeout{1000};
    uint16_t port = 22;
    std::size_t max_workers = 50;
    uint32_t first_host = 1;
    uint32_t last_host = 254;
};

struct connection_config {
    uint16_t port = 22;
    std::string default_username = "deck";
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds keepalive_interval{30000};
    reconnect_policy reconnect;
    std::string known_hosts_path;  ///< empty = ~/.ssh/known_hosts
    std::string secret_service = "DeckBridge";
};

struct transfer_config {
    std::size_t chunk_size = 256 * 1024;  // 256KB
    std::size_t rate_window_size = 10;
    std::chrono::milliseconds availability_poll{100};
};

[[nodiscard]] auto validate(const discovery_config& cfg) -> result<void>;
[[nodiscard]] auto validate(const connection_config& cfg) -> result<void>;
[[nodiscard]] auto validate(const transfer_config& cfg) -> result<void>;

/**
 * @brief Complete engine configuration
 */
struct bridge_config {
    discovery_config discovery;
    connection_config connection;
    transfer_config transfer;
    std::string remote_start_path = "/home/deck";

    class builder;
};

/**
 * @brief Builder for validated configurations
 *
 * @code
 * auto cfg = bridge_config::builder()
 *     .with_chunk_size(512 * 1024)
 *     .with_keepalive_interval(std::chrono::seconds(15))
 *     .build();
 * if (!cfg) { ... cfg.error().message ... }
 * @endcode
 */
class bridge_config::builder {
public:
    builder();

    auto with_mdns_hostname(std::string hostname) -> builder&;
    auto with_mdns_timeout(std::chrono::milliseconds timeout) -> builder&;
    auto with_probe_timeout(std::chrono::milliseconds timeout) -> builder&;
    auto with_scan_workers(std::size_t workers) -> builder&;
    auto with_host_range(uint32_t first, uint32_t last) -> builder&;

    auto with_ssh_port(uint16_t port) -> builder&;
    auto with_username(std::string username) -> builder&;
    auto with_connect_timeout(std::chrono::milliseconds timeout) -> builder&;
    auto with_keepalive_interval(std::chrono::milliseconds interval) -> builder&;
    auto with_reconnect_policy(reconnect_policy policy) -> builder&;
    auto with_known_hosts_path(std::string path) -> builder&;

    auto with_chunk_size(std::size_t size) -> builder&;
    auto with_rate_window(std::size_t samples) -> builder&;

    auto with_remote_start_path(std::string path) -> builder&;

    /**
     * @brief Validate and return the configuration
     * @return error_code::invalid_configuration naming the first bad field
     */
    [[nodiscard]] auto build() -> result<bridge_config>;

private:
    bridge_config config_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CONFIG_BRIDGE_CONFIG_H
