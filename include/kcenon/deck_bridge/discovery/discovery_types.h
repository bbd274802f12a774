/**
 * @file discovery_types.h
 * @brief Device and event types produced by discovery_engine
 */

#ifndef KCENON_DECK_BRIDGE_DISCOVERY_DISCOVERY_TYPES_H
#define KCENON_DECK_BRIDGE_DISCOVERY_DISCOVERY_TYPES_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief How a device was found
 */
enum class discovery_source {
    mdns,  ///< well-known name resolved
    scan   ///< subnet port probe answered
};

[[nodiscard]] constexpr auto to_string(discovery_source source) noexcept -> const char* {
    switch (source) {
        case discovery_source::mdns: return "mdns";
        case discovery_source::scan: return "scan";
        default: return "unknown";
    }
}

/**
 * @brief Probe latency, fractional milliseconds
 */
using probe_latency = std::chrono::duration<double, std::milli>;

/**
 * @brief Network endpoint reachable on the SSH port
 *
 * Within one discovery run, address is unique.
 */
struct device {
    std::string host;     ///< mDNS name, PTR name, or the address itself
    std::string address;  ///< IPv4 literal
    probe_latency response_time{0};
    discovery_source via = discovery_source::scan;
};

enum class discovery_event_type {
    device_found,
    device_updated,  ///< a later mDNS or PTR answer named an emitted device
    discovery_complete,
    discovery_error
};

[[nodiscard]] constexpr auto to_string(discovery_event_type type) noexcept -> const char* {
    switch (type) {
        case discovery_event_type::device_found: return "device_found";
        case discovery_event_type::device_updated: return "device_updated";
        case discovery_event_type::discovery_complete: return "discovery_complete";
        case discovery_event_type::discovery_error: return "discovery_error";
        default: return "unknown";
    }
}

/**
 * @brief Event published by discovery_engine
 *
 * A run publishes any number of device_found and device_updated events
 * followed by exactly one discovery_complete or discovery_error. A
 * device_updated always refers to an address already reported by
 * device_found.
 */
struct discovery_event {
    discovery_event_type type = discovery_event_type::device_found;
    std::optional<device> found;     ///< device_found, device_updated
    std::size_t device_count = 0;    ///< discovery_complete
    bool cancelled = false;          ///< discovery_complete
    bool timed_out = false;          ///< discovery_complete
    std::optional<error> failure;    ///< discovery_error

    [[nodiscard]] static auto device_found(device d) -> discovery_event {
        discovery_event e;
        e.type = discovery_event_type::device_found;
        e.found = std::move(d);
        return e;
    }

    [[nodiscard]] static auto device_updated(device d) -> discovery_event {
        discovery_event e;
        e.type = discovery_event_type::device_updated;
        e.found = std::move(d);
        return e;
    }

    [[nodiscard]] static auto complete(std::size_t count, bool cancelled, bool timed_out)
        -> discovery_event {
        discovery_event e;
        e.type = discovery_event_type::discovery_complete;
        e.device_count = count;
        e.cancelled = cancelled;
        e.timed_out = timed_out;
        return e;
    }

    [[nodiscard]] static auto failed(error err) -> discovery_event {
        discovery_event e;
        e.type = discovery_event_type::discovery_error;
        e.failure = std::move(err);
        return e;
    }
};

/**
 * @brief Final result of a discovery run
 */
struct discovery_summary {
    std::size_t device_count = 0;
    bool cancelled = false;
    bool timed_out = false;
    std::chrono::milliseconds elapsed{0};
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_DISCOVERY_DISCOVERY_TYPES_H
