/**
 * @file network_prober.cpp
 * @brief POSIX network_prober
 */

#include "kcenon/deck_bridge/discovery/network_prober.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <thread>

#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/socket_utils.h"

namespace kcenon::deck_bridge {

namespace {

/**
 * @brief State shared between a caller and its resolver thread
 *
 * getaddrinfo() and getnameinfo() take no timeout. The lookup runs on its
 * own thread and the caller stops waiting at the deadline; the thread
 * finishes on its own and drops its reference.
 */
struct lookup_state {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    int status = 0;
    std::string answer;

    void finish(int rc, std::string value) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            status = rc;
            answer = std::move(value);
            done = true;
        }
        cv.notify_all();
    }

    /**
     * @return false when @p timeout passed before the lookup finished
     */
    auto wait(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return done; });
    }
};

void run_forward_lookup(const std::shared_ptr<lookup_state>& state, const std::string& name) {
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = ::getaddrinfo(name.c_str(), nullptr, &hints, &res);

    std::string address;
    if (rc == 0 && res != nullptr) {
        char buf[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr) {
            address = buf;
        }
    }
    if (res != nullptr) {
        ::freeaddrinfo(res);
    }
    state->finish(rc, std::move(address));
}

void run_reverse_lookup(const std::shared_ptr<lookup_state>& state, struct sockaddr_in sin) {
    char host[NI_MAXHOST];
    int rc = ::getnameinfo(reinterpret_cast<struct sockaddr*>(&sin), sizeof(sin), host,
                           sizeof(host), nullptr, 0, NI_NAMEREQD);
    state->finish(rc, rc == 0 ? std::string(host) : std::string());
}

}  // namespace

auto subnet_base(const std::string& ipv4) -> std::optional<std::string> {
    struct in_addr addr{};
    if (::inet_pton(AF_INET, ipv4.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    auto pos = ipv4.rfind('.');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return ipv4.substr(0, pos);
}

auto system_prober::resolve_host(const std::string& name, std::chrono::milliseconds timeout)
    -> result<std::string> {
    auto state = std::make_shared<lookup_state>();
    std::thread([state, name] { run_forward_lookup(state, name); }).detach();

    if (!state->wait(timeout)) {
        return unexpected{error{error_code::timeout, "resolving " + name + " timed out"}};
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->status != 0 || state->answer.empty()) {
        return unexpected{error{error_code::host_unreachable,
                                "cannot resolve " + name + ": " + ::gai_strerror(state->status)}};
    }
    return state->answer;
}

auto system_prober::probe_port(const std::string& address,
                               uint16_t port,
                               std::chrono::milliseconds timeout,
                               const std::atomic<bool>& cancel) -> result<probe_latency> {
    auto start = std::chrono::steady_clock::now();
    auto sock = tcp_connect(address, port, timeout, &cancel);
    if (!sock) {
        return unexpected{sock.error()};
    }
    return std::chrono::duration_cast<probe_latency>(std::chrono::steady_clock::now() - start);
}

auto system_prober::local_ipv4_address() -> result<std::string> {
    auto interfaces = list_ipv4_interfaces();
    if (!interfaces) {
        return unexpected{interfaces.error()};
    }
    for (const auto& iface : interfaces.value()) {
        if (iface.is_up && !iface.is_loopback) {
            DB_LOG_DEBUG(log_category::discovery,
                         "Using interface " + iface.name + " (" + iface.address + ")");
            return iface.address;
        }
    }
    return unexpected{error{error_code::no_network, "no active IPv4 interface"}};
}

auto system_prober::reverse_lookup(const std::string& address,
                                   std::chrono::milliseconds timeout)
    -> std::optional<std::string> {
    struct sockaddr_in sin{};
    sin.sin_family = AF_INET;
    if (::inet_pton(AF_INET, address.c_str(), &sin.sin_addr) != 1) {
        return std::nullopt;
    }

    auto state = std::make_shared<lookup_state>();
    std::thread([state, sin] { run_reverse_lookup(state, sin); }).detach();

    if (!state->wait(timeout)) {
        DB_LOG_DEBUG(log_category::discovery, "PTR lookup for " + address + " timed out");
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->status != 0 || state->answer.empty()) {
        return std::nullopt;
    }
    return state->answer;
}

}  // namespace kcenon::deck_bridge
