/**
 * @file socket_utils.h
 * @brief POSIX socket helpers shared by discovery probes and the SFTP backend
 */

#ifndef KCENON_DECK_BRIDGE_CORE_SOCKET_UTILS_H
#define KCENON_DECK_BRIDGE_CORE_SOCKET_UTILS_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Owning wrapper around a socket descriptor
 */
class socket_handle {
public:
    socket_handle() = default;
    explicit socket_handle(int fd) : fd_(fd) {}
    ~socket_handle();

    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;
    socket_handle(socket_handle&& other) noexcept;
    socket_handle& operator=(socket_handle&& other) noexcept;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    /**
     * @brief Give up ownership without closing
     */
    auto release() noexcept -> int;

    void reset() noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Open a TCP connection with an upper bound on the connect time
 *
 * The connect runs non-blocking and is polled in short slices so that
 * @p cancel (when given) is honoured promptly. The returned socket is back
 * in blocking mode with SO_KEEPALIVE set.
 *
 * Errors: timeout, host_unreachable (refused, no route, resolution failure),
 * cancelled.
 */
[[nodiscard]] auto tcp_connect(const std::string& address,
                               uint16_t port,
                               std::chrono::milliseconds timeout,
                               const std::atomic<bool>* cancel = nullptr)
    -> result<socket_handle>;

struct ipv4_interface {
    std::string name;
    std::string address;
    std::string netmask;
    bool is_up = false;
    bool is_loopback = false;
};

/**
 * @brief IPv4 addresses of the local interfaces (getifaddrs)
 */
[[nodiscard]] auto list_ipv4_interfaces() -> result<std::vector<ipv4_interface>>;

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CORE_SOCKET_UTILS_H
