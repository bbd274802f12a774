/**
 * @file socket_utils.cpp
 * @brief POSIX socket helpers
 */

#include "kcenon/deck_bridge/core/socket_utils.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

namespace kcenon::deck_bridge {

namespace {

constexpr std::chrono::milliseconds poll_slice{50};

auto set_nonblocking(int fd, bool enable) -> bool {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

auto connect_error(int err, const std::string& target) -> unexpected {
    auto code = from_errno(err);
    if (code == error_code::path_not_found || code == error_code::permission_denied ||
        code == error_code::io_failure) {
        code = error_code::host_unreachable;
    }
    return unexpected{error{code, "connect " + target + ": " + std::strerror(err)}};
}

}  // namespace

socket_handle::~socket_handle() {
    reset();
}

socket_handle::socket_handle(socket_handle&& other) noexcept : fd_(other.release()) {}

socket_handle& socket_handle::operator=(socket_handle&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.release();
    }
    return *this;
}

auto socket_handle::release() noexcept -> int {
    return std::exchange(fd_, -1);
}

void socket_handle::reset() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto tcp_connect(const std::string& address,
                 uint16_t port,
                 std::chrono::milliseconds timeout,
                 const std::atomic<bool>* cancel) -> result<socket_handle> {
    const std::string target = address + ":" + std::to_string(port);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    auto port_str = std::to_string(port);
    int gai = ::getaddrinfo(address.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        return unexpected{error{error_code::host_unreachable,
                                "resolve " + address + ": " + ::gai_strerror(gai)}};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int last_err = EHOSTUNREACH;

    for (auto* rp = res; rp != nullptr; rp = rp->ai_next) {
        socket_handle sock(::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
        if (!sock.valid()) {
            last_err = errno;
            continue;
        }
        if (!set_nonblocking(sock.get(), true)) {
            last_err = errno;
            continue;
        }

        int rc = ::connect(sock.get(), rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) {
            last_err = errno;
            continue;
        }

        while (rc != 0) {
            if (cancel && cancel->load()) {
                ::freeaddrinfo(res);
                return unexpected{error{error_code::cancelled, "connect " + target + " cancelled"}};
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                ::freeaddrinfo(res);
                return unexpected{error{error_code::timeout, "connect " + target + " timed out"}};
            }

            struct pollfd pfd{};
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            auto slice = std::min(remaining, poll_slice);
            int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
            if (ready < 0 && errno != EINTR) {
                last_err = errno;
                break;
            }
            if (ready <= 0) {
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
                so_error = errno;
            }
            if (so_error != 0) {
                last_err = so_error;
                break;
            }
            rc = 0;
        }
        if (rc != 0) {
            continue;
        }

        if (!set_nonblocking(sock.get(), false)) {
            last_err = errno;
            continue;
        }
        int opt = 1;
        ::setsockopt(sock.get(), SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

        ::freeaddrinfo(res);
        return sock;
    }

    ::freeaddrinfo(res);
    return connect_error(last_err, target);
}

auto list_ipv4_interfaces() -> result<std::vector<ipv4_interface>> {
    struct ifaddrs* addrs = nullptr;
    if (::getifaddrs(&addrs) != 0) {
        return unexpected{error{error_code::no_network,
                                std::string("getifaddrs: ") + std::strerror(errno)}};
    }

    std::vector<ipv4_interface> interfaces;
    for (struct ifaddrs* addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr || addr->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        ipv4_interface iface;
        iface.name = addr->ifa_name;
        iface.is_up = (addr->ifa_flags & IFF_UP) != 0 && (addr->ifa_flags & IFF_RUNNING) != 0;
        iface.is_loopback = (addr->ifa_flags & IFF_LOOPBACK) != 0;

        char ip_str[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(addr->ifa_addr);
        ::inet_ntop(AF_INET, &sin->sin_addr, ip_str, sizeof(ip_str));
        iface.address = ip_str;

        if (addr->ifa_netmask != nullptr) {
            auto* mask = reinterpret_cast<struct sockaddr_in*>(addr->ifa_netmask);
            ::inet_ntop(AF_INET, &mask->sin_addr, ip_str, sizeof(ip_str));
            iface.netmask = ip_str;
        }

        interfaces.push_back(std::move(iface));
    }

    ::freeifaddrs(addrs);
    return interfaces;
}

}  // namespace kcenon::deck_bridge
