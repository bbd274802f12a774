/**
 * @file network_prober.h
 * @brief Network primitives used by discovery_engine
 *
 * discovery_engine never touches sockets itself; every lookup and probe
 * goes through a network_prober so runs can be driven deterministically.
 */

#ifndef KCENON_DECK_BRIDGE_DISCOVERY_NETWORK_PROBER_H
#define KCENON_DECK_BRIDGE_DISCOVERY_NETWORK_PROBER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/deck_bridge/core/types.h"
#include "kcenon/deck_bridge/discovery/discovery_types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Name resolution and port probing
 *
 * Implementations must be safe to call from many threads at once.
 */
class network_prober {
public:
    virtual ~network_prober() = default;

    /**
     * @brief Resolve @p name to an IPv4 address
     * @return host_unreachable when the name does not resolve, timeout when
     *         @p timeout passes first
     */
    [[nodiscard]] virtual auto resolve_host(const std::string& name,
                                            std::chrono::milliseconds timeout)
        -> result<std::string> = 0;

    /**
     * @brief TCP connect to @p address:@p port and close again
     * @return Connect latency. A closed or silent port is an error
     *         (host_unreachable, timeout); cancelled when @p cancel is set.
     */
    [[nodiscard]] virtual auto probe_port(const std::string& address,
                                          uint16_t port,
                                          std::chrono::milliseconds timeout,
                                          const std::atomic<bool>& cancel)
        -> result<probe_latency> = 0;

    /**
     * @brief IPv4 address of the first interface that is up and not loopback
     * @return error_code::no_network when there is none
     */
    [[nodiscard]] virtual auto local_ipv4_address() -> result<std::string> = 0;

    /**
     * @brief PTR name for @p address, when one exists
     *
     * Gives up and returns std::nullopt once @p timeout has passed.
     */
    [[nodiscard]] virtual auto reverse_lookup(const std::string& address,
                                              std::chrono::milliseconds timeout)
        -> std::optional<std::string> = 0;
};

/**
 * @brief network_prober over the POSIX socket and resolver APIs
 */
class system_prober : public network_prober {
public:
    system_prober() = default;
    ~system_prober() override = default;

    [[nodiscard]] auto resolve_host(const std::string& name, std::chrono::milliseconds timeout)
        -> result<std::string> override;

    [[nodiscard]] auto probe_port(const std::string& address,
                                  uint16_t port,
                                  std::chrono::milliseconds timeout,
                                  const std::atomic<bool>& cancel)
        -> result<probe_latency> override;

    [[nodiscard]] auto local_ipv4_address() -> result<std::string> override;

    [[nodiscard]] auto reverse_lookup(const std::string& address,
                                      std::chrono::milliseconds timeout)
        -> std::optional<std::string> override;
};

/**
 * @brief "a.b.c" for the /24 containing @p ipv4
 * @return std::nullopt when @p ipv4 is not a dotted quad
 */
[[nodiscard]] auto subnet_base(const std::string& ipv4) -> std::optional<std::string>;

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_DISCOVERY_NETWORK_PROBER_H
