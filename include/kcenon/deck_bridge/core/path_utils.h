/**
 * @file path_utils.h
 * @brief Remote path validation and display helpers
 */

#ifndef KCENON_DECK_BRIDGE_CORE_PATH_UTILS_H
#define KCENON_DECK_BRIDGE_CORE_PATH_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Suffix of the resumable temporary destination file
 */
inline constexpr std::string_view temp_suffix = ".tmp";

/**
 * @brief Validate a remote POSIX path before it reaches a channel
 *
 * Only absolute paths pass. Empty or relative paths, paths containing a
 * NUL byte and paths with any ".." segment are rejected, each with
 * error_code::path_traversal_rejected.
 */
[[nodiscard]] auto validate_remote_path(std::string_view path) -> result<void>;

/**
 * @brief Join POSIX path components with a single '/'
 *
 * An absolute @p name replaces @p base; an empty @p base yields @p name.
 */
[[nodiscard]] auto posix_join(std::string_view base, std::string_view name) -> std::string;

/**
 * @brief Final component of a POSIX path ("" for "/")
 */
[[nodiscard]] auto posix_basename(std::string_view path) -> std::string;

/**
 * @brief Parent of a POSIX path ("/" for top-level entries, "" for bare names)
 */
[[nodiscard]] auto posix_parent(std::string_view path) -> std::string;

/**
 * @brief Format a byte count as "512 B", "1.5 KB", "3.2 GB"
 *
 * Negative counts format as "0 B".
 */
[[nodiscard]] auto human_readable_size(int64_t bytes) -> std::string;

/**
 * @brief Breadcrumb segments of a remote path
 *
 * "/home/deck/roms" gives {("/", "/"), ("home", "/home"),
 * ("deck", "/home/deck"), ("roms", "/home/deck/roms")}.
 * Each pair is (label, cumulative path).
 */
[[nodiscard]] auto remote_path_segments(std::string_view path)
    -> std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Temporary file name used while a destination is being written
 */
[[nodiscard]] inline auto temp_path_for(std::string_view destination) -> std::string {
    return std::string(destination) + std::string(temp_suffix);
}

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CORE_PATH_UTILS_H
