/**
 * @file bridge_config.cpp
 * @brief Configuration defaults, backoff arithmetic and validation
 */

#include "kcenon/deck_bridge/config/bridge_config.h"

#include <algorithm>
#include <cmath>

#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/path_utils.h"

namespace kcenon::deck_bridge {

namespace {

auto invalid(const std::string& message) -> unexpected {
    DB_LOG_WARN(log_category::config, "Rejected configuration: " + message);
    return unexpected{error{error_code::invalid_configuration, message}};
}

constexpr std::size_t min_chunk_size = 1024;
constexpr std::size_t max_chunk_size = 16 * 1024 * 1024;
constexpr std::size_t max_scan_workers = 256;
constexpr std::size_t max_reconnect_attempts = 10;

}  // namespace

auto reconnect_policy::delay_for_attempt(std::size_t attempt) const
    -> std::chrono::milliseconds {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    double factor = std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
    double delay = static_cast<double>(initial_delay.count()) * factor;
    double cap = static_cast<double>(max_delay.count());
    return std::chrono::milliseconds{static_cast<int64_t>(std::min(delay, cap))};
}

auto validate(const discovery_config& cfg) -> result<void> {
    if (cfg.mdns_hostname.empty()) {
        return invalid("mDNS hostname must not be empty");
    }
    if (cfg.mdns_timeout.count() <= 0 || cfg.probe_timeout.count() <= 0) {
        return invalid("discovery timeouts must be positive");
    }
    if (cfg.port == 0) {
        return invalid("discovery port must not be 0");
    }
    if (cfg.max_workers == 0 || cfg.max_workers > max_scan_workers) {
        return invalid("scan workers must be between 1 and " + std::to_string(max_scan_workers));
    }
    if (cfg.first_host < 1 || cfg.last_host > 254 || cfg.first_host > cfg.last_host) {
        return invalid("host range must lie within 1-254");
    }
    return {};
}

auto validate(const connection_config& cfg) -> result<void> {
    if (cfg.port == 0) {
        return invalid("SSH port must not be 0");
    }
    if (cfg.default_username.empty()) {
        return invalid("username must not be empty");
    }
    if (cfg.connect_timeout.count() <= 0) {
        return invalid("connect timeout must be positive");
    }
    if (cfg.keepalive_interval.count() <= 0) {
        return invalid("keepalive interval must be positive");
    }
    const auto& policy = cfg.reconnect;
    if (policy.max_attempts > max_reconnect_attempts) {
        return invalid("reconnect attempts must not exceed " +
                       std::to_string(max_reconnect_attempts));
    }
    if (policy.initial_delay.count() < 0 || policy.max_delay < policy.initial_delay) {
        return invalid("reconnect delays must satisfy 0 <= initial <= max");
    }
    if (policy.backoff_multiplier < 1.0) {
        return invalid("backoff multiplier must be at least 1.0");
    }
    return {};
}

auto validate(const transfer_config& cfg) -> result<void> {
    if (cfg.chunk_size < min_chunk_size || cfg.chunk_size > max_chunk_size) {
        return invalid("chunk size must be between 1KB and 16MB");
    }
    if (cfg.rate_window_size < 2) {
        return invalid("rate window needs at least 2 samples");
    }
    if (cfg.availability_poll.count() <= 0) {
        return invalid("availability poll interval must be positive");
    }
    return {};
}

bridge_config::builder::builder() = default;

auto bridge_config::builder::with_mdns_hostname(std::string hostname) -> builder& {
    config_.discovery.mdns_hostname = std::move(hostname);
    return *this;
}

auto bridge_config::builder::with_mdns_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.discovery.mdns_timeout = timeout;
    return *this;
}

auto bridge_config::builder::with_probe_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.discovery.probe_timeout = timeout;
    return *this;
}

auto bridge_config::builder::with_scan_workers(std::size_t workers) -> builder& {
    config_.discovery.max_workers = workers;
    return *this;
}

auto bridge_config::builder::with_host_range(uint32_t first, uint32_t last) -> builder& {
    config_.discovery.first_host = first;
    config_.discovery.last_host = last;
    return *this;
}

auto bridge_config::builder::with_ssh_port(uint16_t port) -> builder& {
    config_.discovery.port = port;
    config_.connection.port = port;
    return *this;
}

auto bridge_config::builder::with_username(std::string username) -> builder& {
    config_.connection.default_username = std::move(username);
    return *this;
}

auto bridge_config::builder::with_connect_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.connection.connect_timeout = timeout;
    return *this;
}

auto bridge_config::builder::with_keepalive_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.connection.keepalive_interval = interval;
    return *this;
}

auto bridge_config::builder::with_reconnect_policy(reconnect_policy policy) -> builder& {
    config_.connection.reconnect = policy;
    return *this;
}

auto bridge_config::builder::with_known_hosts_path(std::string path) -> builder& {
    config_.connection.known_hosts_path = std::move(path);
    return *this;
}

auto bridge_config::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.transfer.chunk_size = size;
    return *this;
}

auto bridge_config::builder::with_rate_window(std::size_t samples) -> builder& {
    config_.transfer.rate_window_size = samples;
    return *this;
}

auto bridge_config::builder::with_remote_start_path(std::string path) -> builder& {
    config_.remote_start_path = std::move(path);
    return *this;
}

auto bridge_config::builder::build() -> result<bridge_config> {
    if (auto r = validate(config_.discovery); !r) {
        return unexpected{r.error()};
    }
    if (auto r = validate(config_.connection); !r) {
        return unexpected{r.error()};
    }
    if (auto r = validate(config_.transfer); !r) {
        return unexpected{r.error()};
    }
    if (config_.remote_start_path.empty() || config_.remote_start_path.front() != '/') {
        return invalid("remote start path must be absolute");
    }
    if (auto r = validate_remote_path(config_.remote_start_path); !r) {
        return invalid("remote start path rejected: " + r.error().message);
    }
    return config_;
}

}  // namespace kcenon::deck_bridge
