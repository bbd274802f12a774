/**
 * @file error_codes.h
 * @brief Error codes for deck_bridge (-600 to -699 range)
 *
 * Error code ranges:
 * - -600 to -619: Connection Errors
 * - -620 to -639: Path Errors
 * - -640 to -659: Transfer Errors
 * - -660 to -679: State and Configuration Errors
 * - -690 to -699: Internal Errors
 */

#ifndef KCENON_DECK_BRIDGE_CORE_ERROR_CODES_H
#define KCENON_DECK_BRIDGE_CORE_ERROR_CODES_H

#include <cerrno>
#include <cstdint>
#include <string_view>

namespace kcenon::deck_bridge {

/**
 * @brief Error classification shared by every deck_bridge component
 */
enum class error_code : int32_t {
    success = 0,

    // Connection Errors (-600 to -619)
    authentication_failure = -600,
    host_unreachable = -601,
    timeout = -602,
    untrusted_host = -603,
    no_network = -604,

    // Path Errors (-620 to -639)
    permission_denied = -620,
    path_not_found = -621,
    path_traversal_rejected = -622,

    // Transfer Errors (-640 to -659)
    io_failure = -640,
    cancelled = -641,

    // State and Configuration Errors (-660 to -679)
    corrupt_state = -660,
    invalid_state_transition = -661,
    invalid_configuration = -662,
    job_not_found = -663,

    // Internal Errors (-690 to -699)
    internal_error = -690,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::authentication_failure:
            return "authentication failure";
        case error_code::host_unreachable:
            return "host unreachable";
        case error_code::timeout:
            return "timeout";
        case error_code::untrusted_host:
            return "untrusted host";
        case error_code::no_network:
            return "no network";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::path_not_found:
            return "path not found";
        case error_code::path_traversal_rejected:
            return "path traversal rejected";
        case error_code::io_failure:
            return "I/O failure";
        case error_code::cancelled:
            return "cancelled";
        case error_code::corrupt_state:
            return "corrupt state";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::job_not_found:
            return "job not found";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_connection_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -600 && v >= -619;
}

[[nodiscard]] constexpr auto is_path_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -620 && v >= -639;
}

/**
 * @brief Transient conditions that the connection backoff loop retries
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return code == error_code::timeout || code == error_code::host_unreachable;
}

/**
 * @brief Conditions that end a connection cycle until the caller acts
 */
[[nodiscard]] constexpr auto requires_caller_input(error_code code) noexcept -> bool {
    return code == error_code::authentication_failure ||
           code == error_code::untrusted_host;
}

/**
 * @brief Channel operation failures that mean the session itself is gone
 */
[[nodiscard]] constexpr auto is_connection_loss(error_code code) noexcept -> bool {
    return code == error_code::host_unreachable || code == error_code::timeout;
}

/**
 * @brief Classify a POSIX errno value into the taxonomy
 */
[[nodiscard]] constexpr auto from_errno(int err) noexcept -> error_code {
    switch (err) {
        case 0:
            return error_code::success;
        case EACCES:
        case EPERM:
        case EROFS:
            return error_code::permission_denied;
        case ENOENT:
        case ENOTDIR:
            return error_code::path_not_found;
        case ETIMEDOUT:
            return error_code::timeout;
        case ECONNREFUSED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ECONNRESET:
        case ECONNABORTED:
        case EPIPE:
            return error_code::host_unreachable;
        case ENETDOWN:
            return error_code::no_network;
        case ECANCELED:
            return error_code::cancelled;
        default:
            return error_code::io_failure;
    }
}

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CORE_ERROR_CODES_H
