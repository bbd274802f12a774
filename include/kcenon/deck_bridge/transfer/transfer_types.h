/**
 * @file transfer_types.h
 * @brief Transfer job, request and event types
 */

#ifndef KCENON_DECK_BRIDGE_TRANSFER_TRANSFER_TYPES_H
#define KCENON_DECK_BRIDGE_TRANSFER_TRANSFER_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Transfer direction enumeration
 */
enum class transfer_direction {
    upload,   ///< local -> device
    download  ///< device -> local
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) noexcept -> const char* {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

enum class transfer_kind {
    file,
    directory  ///< recursive
};

/**
 * @brief Job status
 */
enum class transfer_status {
    queued,            ///< Waiting for the worker (or for a connection)
    active,            ///< Being transferred
    paused_resumable,  ///< Waiting on an overwrite decision
    completed,         ///< Renamed into place
    failed,            ///< I/O or connection error; temp file kept
    cancelled,         ///< Cancelled by the caller; temp file kept
    skipped            ///< Caller declined to overwrite
};

/**
 * @brief Convert transfer_status to string
 */
[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> const char* {
    switch (status) {
        case transfer_status::queued: return "queued";
        case transfer_status::active: return "active";
        case transfer_status::paused_resumable: return "paused_resumable";
        case transfer_status::completed: return "completed";
        case transfer_status::failed: return "failed";
        case transfer_status::cancelled: return "cancelled";
        case transfer_status::skipped: return "skipped";
        default: return "unknown";
    }
}

/**
 * @brief Check if status is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_status(transfer_status status) noexcept -> bool {
    return status == transfer_status::completed || status == transfer_status::failed ||
           status == transfer_status::cancelled || status == transfer_status::skipped;
}

/**
 * @brief What to do when the destination already exists
 */
enum class overwrite_policy {
    ask,        ///< publish overwrite_decision_needed and wait
    overwrite,
    skip
};

/**
 * @brief Caller answer to overwrite_decision_needed
 */
enum class overwrite_decision {
    overwrite,
    skip
};

/**
 * @brief What the caller asks to move
 *
 * For uploads source_path is local and destination_path is remote; for
 * downloads the other way round. Remote paths are POSIX paths.
 */
struct transfer_request {
    transfer_direction direction = transfer_direction::upload;
    std::string source_path;
    std::string destination_path;
    overwrite_policy overwrite = overwrite_policy::ask;

    [[nodiscard]] static auto upload(std::string local,
                                     std::string remote,
                                     overwrite_policy policy = overwrite_policy::ask)
        -> transfer_request {
        return {transfer_direction::upload, std::move(local), std::move(remote), policy};
    }

    [[nodiscard]] static auto download(std::string remote,
                                       std::string local,
                                       overwrite_policy policy = overwrite_policy::ask)
        -> transfer_request {
        return {transfer_direction::download, std::move(remote), std::move(local), policy};
    }

    [[nodiscard]] auto remote_path() const -> const std::string& {
        return direction == transfer_direction::upload ? destination_path : source_path;
    }

    [[nodiscard]] auto local_path() const -> const std::string& {
        return direction == transfer_direction::upload ? source_path : destination_path;
    }
};

/**
 * @brief Snapshot of one job
 */
struct transfer_job {
    job_id id;
    transfer_direction direction = transfer_direction::upload;
    transfer_kind kind = transfer_kind::file;
    std::string source_path;
    std::string destination_path;
    overwrite_policy overwrite = overwrite_policy::ask;

    std::optional<uint64_t> total_bytes;  ///< std::nullopt until known
    uint64_t bytes_transferred = 0;
    uint64_t resume_offset = 0;           ///< bytes found in temp files at start
    std::size_t files_total = 0;
    std::size_t files_done = 0;

    transfer_status status = transfer_status::queued;
    std::optional<error> last_error;

    std::chrono::system_clock::time_point queued_at{};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
};

enum class transfer_event_type {
    job_queued,
    job_progress,
    job_terminal,
    overwrite_decision_needed
};

[[nodiscard]] constexpr auto to_string(transfer_event_type type) noexcept -> const char* {
    switch (type) {
        case transfer_event_type::job_queued: return "job_queued";
        case transfer_event_type::job_progress: return "job_progress";
        case transfer_event_type::job_terminal: return "job_terminal";
        case transfer_event_type::overwrite_decision_needed: return "overwrite_decision_needed";
        default: return "unknown";
    }
}

/**
 * @brief Event published by transfer_engine
 *
 * For one job: job_queued first, job_terminal last, bytes_transferred
 * non-decreasing in between.
 */
struct transfer_event {
    transfer_event_type type = transfer_event_type::job_queued;
    job_id id;
    transfer_status status = transfer_status::queued;

    uint64_t bytes_transferred = 0;
    std::optional<uint64_t> total_bytes;
    double speed = 0.0;                          ///< bytes/sec, sliding window
    std::optional<std::chrono::milliseconds> eta;  ///< std::nullopt = indeterminate

    std::optional<error_code> error_kind;  ///< job_terminal
    std::string message;
    std::string path;                      ///< overwrite_decision_needed
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_TRANSFER_TRANSFER_TYPES_H
