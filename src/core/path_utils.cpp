/**
 * @file path_utils.cpp
 * @brief Remote path validation and display helpers
 */

#include "kcenon/deck_bridge/core/path_utils.h"

#include <array>
#include <cstdio>

namespace kcenon::deck_bridge {

auto validate_remote_path(std::string_view path) -> result<void> {
    if (path.empty()) {
        return unexpected{error{error_code::path_traversal_rejected, "empty remote path"}};
    }
    if (path.find('\0') != std::string_view::npos) {
        return unexpected{error{error_code::path_traversal_rejected,
                                "remote path contains a NUL byte"}};
    }
    if (path.front() != '/') {
        return unexpected{error{error_code::path_traversal_rejected,
                                "remote path is not absolute: " + std::string(path)}};
    }

    size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (path.substr(pos, next - pos) == "..") {
            return unexpected{error{error_code::path_traversal_rejected,
                                    "remote path contains '..': " + std::string(path)}};
        }
        pos = next + 1;
    }
    return {};
}

auto posix_join(std::string_view base, std::string_view name) -> std::string {
    if (base.empty() || (!name.empty() && name.front() == '/')) {
        return std::string(name);
    }
    if (name.empty()) {
        return std::string(base);
    }
    std::string joined(base);
    if (joined.back() != '/') {
        joined += '/';
    }
    joined += name;
    return joined;
}

auto posix_basename(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path == "/") {
        return {};
    }
    auto slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

auto posix_parent(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    if (slash == 0) {
        return "/";
    }
    return std::string(path.substr(0, slash));
}

auto human_readable_size(int64_t bytes) -> std::string {
    if (bytes < 0) {
        return "0 B";
    }
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    static constexpr std::array<const char*, 5> units = {"KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

auto remote_path_segments(std::string_view path)
    -> std::vector<std::pair<std::string, std::string>> {
    std::vector<std::pair<std::string, std::string>> segments;
    if (path.empty()) {
        return segments;
    }

    std::string cumulative;
    if (path.front() == '/') {
        segments.emplace_back("/", "/");
    }

    size_t pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        auto part = path.substr(pos, next - pos);
        if (!part.empty()) {
            if (path.front() == '/' || !cumulative.empty()) {
                cumulative += '/';
            }
            cumulative += part;
            segments.emplace_back(std::string(part), cumulative);
        }
        pos = next + 1;
    }
    return segments;
}

}  // namespace kcenon::deck_bridge
