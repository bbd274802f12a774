/**
 * @file connection_types.h
 * @brief Connection state machine, credentials and connection events
 */

#ifndef KCENON_DECK_BRIDGE_CONNECTION_CONNECTION_TYPES_H
#define KCENON_DECK_BRIDGE_CONNECTION_CONNECTION_TYPES_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "kcenon/deck_bridge/channel/secure_channel.h"
#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Connection state enumeration
 */
enum class connection_state {
    disconnected,
    connecting,
    connected,
    error
};

/**
 * @brief Convert connection_state to string
 */
[[nodiscard]] constexpr auto to_string(connection_state state) -> const char* {
    switch (state) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Transition table of connection_manager
 *
 * | from         | allowed to                                  |
 * |--------------|---------------------------------------------|
 * | disconnected | connecting                                  |
 * | connecting   | connected, connecting, error, disconnected  |
 * | connected    | connecting, disconnected                    |
 * | error        | connecting, disconnected                    |
 */
[[nodiscard]] constexpr auto is_transition_allowed(connection_state from,
                                                   connection_state to) noexcept -> bool {
    switch (from) {
        case connection_state::disconnected:
            return to == connection_state::connecting;
        case connection_state::connecting:
            return true;
        case connection_state::connected:
            return to == connection_state::connecting || to == connection_state::disconnected;
        case connection_state::error:
            return to == connection_state::connecting || to == connection_state::disconnected;
        default:
            return false;
    }
}

/**
 * @brief How to authenticate against a device
 *
 * Passwords are never carried here; they are looked up in the
 * secret_store under "<username>@<host>".
 */
struct credentials {
    std::string username = "deck";
    auth_method method = auth_method::key;
    std::optional<std::string> key_path;  ///< default: ~/.ssh/id_ed25519, ~/.ssh/id_rsa
};

enum class connection_event_type {
    state_changed,
    host_trust_needed
};

/**
 * @brief Event published by connection_manager
 */
struct connection_event {
    connection_event_type type = connection_event_type::state_changed;

    // state_changed
    connection_state old_state = connection_state::disconnected;
    connection_state new_state = connection_state::disconnected;
    std::string reason;
    std::optional<error> failure;
    std::size_t attempt = 0;                  ///< reconnect attempt, 0 for none
    std::chrono::milliseconds retry_delay{0};  ///< wait before that attempt

    // host_trust_needed
    std::optional<host_identity> identity;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CONNECTION_CONNECTION_TYPES_H
