/**
 * @file local_channel.cpp
 * @brief Filesystem-backed secure_channel implementation
 */

#include "kcenon/deck_bridge/channel/local_channel.h"

#include <cerrno>
#include <fstream>
#include <system_error>

#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/path_utils.h"

namespace kcenon::deck_bridge {

namespace fs = std::filesystem;

namespace {

auto fs_error(const std::error_code& ec, const std::string& what) -> unexpected {
    return unexpected{error{from_errno(ec.value()), what + ": " + ec.message()}};
}

auto errno_error(const std::string& what) -> unexpected {
    int err = errno;
    auto code = err != 0 ? from_errno(err) : error_code::io_failure;
    return unexpected{error{code, what}};
}

auto to_system_time(fs::file_time_type ft) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

class local_read_stream : public read_stream {
public:
    explicit local_read_stream(std::ifstream file) : file_(std::move(file)) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty()) {
            return std::size_t{0};
        }
        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        auto count = static_cast<std::size_t>(file_.gcount());
        if (file_.bad()) {
            return errno_error("read failed");
        }
        return count;
    }

private:
    std::ifstream file_;
};

class local_write_stream : public write_stream {
public:
    explicit local_write_stream(std::ofstream file) : file_(std::move(file)) {}

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override {
        if (!file_.is_open()) {
            return unexpected{error{error_code::io_failure, "stream already closed"}};
        }
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return errno_error("write failed");
        }
        return {};
    }

    [[nodiscard]] auto close() -> result<void> override {
        if (!file_.is_open()) {
            return {};
        }
        file_.flush();
        bool ok = static_cast<bool>(file_);
        file_.close();
        if (!ok || file_.fail()) {
            return errno_error("close failed");
        }
        return {};
    }

private:
    std::ofstream file_;
};

}  // namespace

local_channel::local_channel(fs::path root) : root_(std::move(root)) {}

local_channel::~local_channel() = default;

auto local_channel::resolve(const std::string& path) const -> fs::path {
    return root_ / fs::path(path).relative_path();
}

auto local_channel::list_directory(const std::string& path)
    -> result<std::vector<remote_entry>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }

    std::error_code ec;
    fs::directory_iterator it(resolve(path), ec);
    if (ec) {
        return fs_error(ec, "cannot list " + path);
    }

    std::vector<remote_entry> entries;
    for (const auto& item : it) {
        remote_entry entry;
        entry.name = item.path().filename().string();
        entry.is_directory = item.is_directory(ec);
        if (!entry.is_directory) {
            auto size = item.file_size(ec);
            entry.size = ec ? 0 : size;
        }
        auto mtime = item.last_write_time(ec);
        if (!ec) {
            entry.modified_time = to_system_time(mtime);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

auto local_channel::stat(const std::string& path) -> result<std::optional<remote_stat>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }

    std::error_code ec;
    auto target = resolve(path);
    auto status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        if (!ec || ec == std::errc::no_such_file_or_directory ||
            ec == std::errc::not_a_directory) {
            return std::optional<remote_stat>{};
        }
        return fs_error(ec, "cannot stat " + path);
    }

    remote_stat st;
    st.is_directory = fs::is_directory(status);
    if (!st.is_directory) {
        st.size = fs::file_size(target, ec);
        if (ec) {
            return fs_error(ec, "cannot size " + path);
        }
    }
    auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        st.modified_time = to_system_time(mtime);
    }
    return std::optional<remote_stat>{st};
}

auto local_channel::open_read(const std::string& path, uint64_t offset)
    -> result<std::unique_ptr<read_stream>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }

    errno = 0;
    std::ifstream file(resolve(path), std::ios::binary);
    if (!file) {
        return errno_error("cannot open " + path + " for reading");
    }
    if (offset > 0) {
        file.seekg(static_cast<std::streamoff>(offset));
        if (!file) {
            return unexpected{error{error_code::io_failure,
                                    "cannot seek " + path + " to " + std::to_string(offset)}};
        }
    }
    return std::unique_ptr<read_stream>(std::make_unique<local_read_stream>(std::move(file)));
}

auto local_channel::open_write(const std::string& path, write_mode mode)
    -> result<std::unique_ptr<write_stream>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }

    auto flags = std::ios::binary | std::ios::out;
    flags |= (mode == write_mode::append) ? std::ios::app : std::ios::trunc;

    errno = 0;
    std::ofstream file(resolve(path), flags);
    if (!file) {
        return errno_error("cannot open " + path + " for writing");
    }
    return std::unique_ptr<write_stream>(std::make_unique<local_write_stream>(std::move(file)));
}

auto local_channel::rename(const std::string& from, const std::string& to) -> result<void> {
    if (auto valid = validate_remote_path(from); !valid) {
        return valid;
    }
    if (auto valid = validate_remote_path(to); !valid) {
        return valid;
    }

    std::error_code ec;
    fs::rename(resolve(from), resolve(to), ec);
    if (ec) {
        return fs_error(ec, "cannot rename " + from + " to " + to);
    }
    return {};
}

auto local_channel::remove(const std::string& path) -> result<void> {
    if (auto valid = validate_remote_path(path); !valid) {
        return valid;
    }

    std::error_code ec;
    if (!fs::remove(resolve(path), ec) && ec) {
        return fs_error(ec, "cannot remove " + path);
    }
    return {};
}

auto local_channel::make_directory(const std::string& path) -> result<void> {
    if (auto valid = validate_remote_path(path); !valid) {
        return valid;
    }

    std::error_code ec;
    auto target = resolve(path);
    fs::create_directory(target, ec);
    if (ec && !fs::is_directory(target)) {
        return fs_error(ec, "cannot create directory " + path);
    }
    return {};
}

auto local_channel::keepalive() -> result<void> {
    if (!open_) {
        return unexpected{error{error_code::host_unreachable, "channel closed"}};
    }
    return {};
}

auto local_channel::is_open() const -> bool {
    return open_;
}

auto local_channel::close() -> result<void> {
    open_ = false;
    return {};
}

local_connector::local_connector(fs::path root) : root_(std::move(root)) {}

auto local_connector::open(const connection_request& request,
                           const host_trust_callback& /*on_unknown_host*/)
    -> result<std::unique_ptr<secure_channel>> {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return unexpected{error{error_code::host_unreachable,
                                "local root missing: " + root_.string()}};
    }
    DB_LOG_DEBUG(log_category::channel,
                 "Opened local channel for " + request.username + "@" + request.host);
    return std::unique_ptr<secure_channel>(std::make_unique<local_channel>(root_));
}

}  // namespace kcenon::deck_bridge
