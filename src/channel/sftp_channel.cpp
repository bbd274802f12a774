/**
 * @file sftp_channel.cpp
 * @brief libssh2 implementation of secure_channel
 */

#include "kcenon/deck_bridge/channel/sftp_channel.h"

#if DECK_BRIDGE_HAS_LIBSSH2

#include <libssh2.h>
#include <libssh2_sftp.h>
#include <sys/socket.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <mutex>

#include "kcenon/deck_bridge/core/fingerprint.h"
#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/path_utils.h"
#include "kcenon/deck_bridge/core/socket_utils.h"

namespace kcenon::deck_bridge {

/**
 * @brief Shared libssh2 session resources
 *
 * Freed when the channel and every stream opened from it are gone.
 */
struct sftp_session_state {
    socket_handle sock;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;
    std::atomic<bool> open{false};
    std::string label;

    ~sftp_session_state() {
        if (sftp) {
            libssh2_sftp_shutdown(sftp);
        }
        if (session) {
            libssh2_session_disconnect(session, "deck_bridge disconnect");
            libssh2_session_free(session);
        }
    }
};

namespace {

constexpr long default_file_mode = 0644;
constexpr long default_dir_mode = 0755;

auto session_message(LIBSSH2_SESSION* session) -> std::string {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string{};
}

auto classify_session_rc(int rc) -> error_code {
    switch (rc) {
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            return error_code::timeout;
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_BANNER_RECV:
        case LIBSSH2_ERROR_BANNER_SEND:
        case LIBSSH2_ERROR_KEX_FAILURE:
            return error_code::host_unreachable;
        case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
        case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        case LIBSSH2_ERROR_FILE:
            return error_code::authentication_failure;
        default:
            return error_code::io_failure;
    }
}

auto classify_sftp_status(unsigned long fx) -> error_code {
    switch (fx) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return error_code::path_not_found;
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            return error_code::permission_denied;
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            return error_code::host_unreachable;
        default:
            return error_code::io_failure;
    }
}

/**
 * @brief Classify the last failure on @p state; marks the session closed on loss
 */
auto last_error(sftp_session_state& state, const std::string& what) -> error {
    int rc = libssh2_session_last_errno(state.session);
    error_code code;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && state.sftp) {
        code = classify_sftp_status(libssh2_sftp_last_error(state.sftp));
    } else {
        code = classify_session_rc(rc);
        if (code == error_code::authentication_failure) {
            code = error_code::io_failure;
        }
    }

    if (is_connection_loss(code)) {
        state.open = false;
    }

    auto detail = session_message(state.session);
    return error{code, detail.empty() ? what : what + ": " + detail};
}

auto closed_error(const sftp_session_state& state) -> unexpected {
    return unexpected{error{error_code::host_unreachable, "session closed: " + state.label}};
}

auto from_attributes(const LIBSSH2_SFTP_ATTRIBUTES& attrs) -> remote_stat {
    remote_stat st;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        st.size = attrs.filesize;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        st.modified_time = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(attrs.mtime));
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        st.is_directory = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    return st;
}

class sftp_read_stream : public read_stream {
public:
    sftp_read_stream(std::shared_ptr<sftp_session_state> state, LIBSSH2_SFTP_HANDLE* handle)
        : state_(std::move(state)), handle_(handle) {}

    ~sftp_read_stream() override {
        if (handle_) {
            libssh2_sftp_close(handle_);
        }
    }

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (!state_->open) {
            return closed_error(*state_);
        }
        auto n = libssh2_sftp_read(handle_, reinterpret_cast<char*>(buffer.data()),
                                   buffer.size());
        if (n < 0) {
            return unexpected{last_error(*state_, "sftp read failed")};
        }
        return static_cast<std::size_t>(n);
    }

private:
    std::shared_ptr<sftp_session_state> state_;
    LIBSSH2_SFTP_HANDLE* handle_;
};

class sftp_write_stream : public write_stream {
public:
    sftp_write_stream(std::shared_ptr<sftp_session_state> state, LIBSSH2_SFTP_HANDLE* handle)
        : state_(std::move(state)), handle_(handle) {}

    ~sftp_write_stream() override {
        if (handle_) {
            libssh2_sftp_close(handle_);
        }
    }

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override {
        if (!handle_) {
            return unexpected{error{error_code::io_failure, "stream already closed"}};
        }
        const char* p = reinterpret_cast<const char*>(data.data());
        std::size_t remain = data.size();
        while (remain > 0) {
            if (!state_->open) {
                return closed_error(*state_);
            }
            auto w = libssh2_sftp_write(handle_, p, remain);
            if (w < 0) {
                return unexpected{last_error(*state_, "sftp write failed")};
            }
            p += w;
            remain -= static_cast<std::size_t>(w);
        }
        return {};
    }

    [[nodiscard]] auto close() -> result<void> override {
        if (!handle_) {
            return {};
        }
        int rc = libssh2_sftp_close(handle_);
        handle_ = nullptr;
        if (rc != 0) {
            return unexpected{last_error(*state_, "sftp close failed")};
        }
        return {};
    }

private:
    std::shared_ptr<sftp_session_state> state_;
    LIBSSH2_SFTP_HANDLE* handle_;
};

// ----------------------------------------------------------------------------
// Handshake helpers
// ----------------------------------------------------------------------------

struct host_key_kind {
    int knownhost_alg;
    const char* name;
};

auto describe_host_key(int keytype) -> host_key_kind {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return {LIBSSH2_KNOWNHOST_KEY_SSHRSA, "ssh-rsa"};
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return {LIBSSH2_KNOWNHOST_KEY_SSHDSS, "ssh-dss"};
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return {LIBSSH2_KNOWNHOST_KEY_ECDSA_256, "ecdsa-sha2-nistp256"};
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return {LIBSSH2_KNOWNHOST_KEY_ECDSA_384, "ecdsa-sha2-nistp384"};
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return {LIBSSH2_KNOWNHOST_KEY_ECDSA_521, "ecdsa-sha2-nistp521"};
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return {LIBSSH2_KNOWNHOST_KEY_ED25519, "ssh-ed25519"};
        default:
            return {LIBSSH2_KNOWNHOST_KEY_UNKNOWN, "unknown"};
    }
}

auto default_known_hosts() -> std::string {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.ssh/known_hosts" : std::string{};
}

/**
 * @brief RAII owner of a LIBSSH2_KNOWNHOSTS collection
 */
class known_hosts_file {
public:
    explicit known_hosts_file(LIBSSH2_SESSION* session)
        : hosts_(libssh2_knownhost_init(session)) {}
    ~known_hosts_file() {
        if (hosts_) {
            libssh2_knownhost_free(hosts_);
        }
    }

    known_hosts_file(const known_hosts_file&) = delete;
    known_hosts_file& operator=(const known_hosts_file&) = delete;

    [[nodiscard]] auto get() const -> LIBSSH2_KNOWNHOSTS* { return hosts_; }

private:
    LIBSSH2_KNOWNHOSTS* hosts_;
};

auto verify_host_key(sftp_session_state& state,
                     const connection_request& request,
                     const host_trust_callback& on_unknown_host) -> result<void> {
    known_hosts_file hosts(state.session);
    if (!hosts.get()) {
        return unexpected{error{error_code::internal_error, "libssh2_knownhost_init failed"}};
    }

    auto path = request.known_hosts_path.empty() ? default_known_hosts()
                                                 : request.known_hosts_path;
    if (!path.empty() &&
        libssh2_knownhost_readfile(hosts.get(), path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        DB_LOG_DEBUG(log_category::channel, "known_hosts not readable: " + path);
    }

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(state.session, &key_len, &key_type);
    if (!key || key_len == 0) {
        return unexpected{error{error_code::untrusted_host, "server presented no host key"}};
    }

    auto kind = describe_host_key(key_type);
    const std::string& host = request.host.empty() ? request.address : request.host;

    struct libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(
        hosts.get(), host.c_str(), request.port, key, key_len,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | kind.knownhost_alg, &match);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        return {};
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        DB_LOG_ERROR(log_category::channel, "Host key for " + host + " does not match known_hosts");
        return unexpected{error{error_code::untrusted_host,
                                "host key for " + host + " changed since it was trusted"}};
    }

    auto fingerprint = sha256_fingerprint(
        std::span<const std::byte>(reinterpret_cast<const std::byte*>(key), key_len));
    if (!fingerprint) {
        return unexpected{fingerprint.error()};
    }

    host_identity identity{host, request.port, kind.name, fingerprint.value()};
    auto decision = on_unknown_host ? on_unknown_host(identity) : trust_decision::reject;

    if (decision == trust_decision::reject) {
        return unexpected{error{error_code::untrusted_host,
                                "host key " + identity.fingerprint + " rejected"}};
    }

    if (decision == trust_decision::accept_and_remember && !path.empty()) {
        std::string entry_host =
            request.port == 22 ? host : "[" + host + "]:" + std::to_string(request.port);
        int added = libssh2_knownhost_addc(
            hosts.get(), entry_host.c_str(), nullptr, key, key_len, nullptr, 0,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | kind.knownhost_alg,
            nullptr);

        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);

        if (added != 0 ||
            libssh2_knownhost_writefile(hosts.get(), path.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            DB_LOG_WARN(log_category::channel,
                        "Could not record host key in " + path + "; trusted for this session");
        } else {
            DB_LOG_INFO(log_category::channel,
                        "Recorded " + identity.key_type + " key for " + entry_host);
        }
    }
    return {};
}

auto authenticate(sftp_session_state& state, const connection_request& request) -> result<void> {
    const auto& user = request.username;

    if (request.method == auth_method::password) {
        int rc = libssh2_userauth_password(state.session, user.c_str(), request.password.c_str());
        if (rc == 0) {
            return {};
        }
        auto code = classify_session_rc(rc);
        if (code == error_code::io_failure) {
            code = error_code::authentication_failure;
        }
        return unexpected{error{code, "password authentication failed for " + user + ": " +
                                          session_message(state.session)}};
    }

    if (request.key_paths.empty()) {
        return unexpected{error{error_code::authentication_failure,
                                "no private key available for " + user}};
    }

    std::string attempts;
    for (const auto& key_path : request.key_paths) {
        int rc = libssh2_userauth_publickey_fromfile(state.session, user.c_str(), nullptr,
                                                     key_path.c_str(), nullptr);
        if (rc == 0) {
            DB_LOG_DEBUG(log_category::channel, "Authenticated with " + key_path);
            return {};
        }
        auto code = classify_session_rc(rc);
        if (code == error_code::timeout || code == error_code::host_unreachable) {
            return unexpected{error{code, "connection lost during authentication"}};
        }
        attempts += (attempts.empty() ? "" : ", ") + key_path;
    }
    return unexpected{error{error_code::authentication_failure,
                            "public key authentication failed for " + user + " (" + attempts + ")"}};
}

std::once_flag libssh2_init_flag;
int libssh2_init_rc = 0;

}  // namespace

// ============================================================================
// sftp_channel
// ============================================================================

sftp_channel::sftp_channel(std::shared_ptr<sftp_session_state> state)
    : state_(std::move(state)) {}

sftp_channel::~sftp_channel() {
    if (state_->open) {
        state_->open = false;
        ::shutdown(state_->sock.get(), SHUT_RDWR);
    }
}

auto sftp_channel::list_directory(const std::string& path) -> result<std::vector<remote_entry>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(state_->sftp, path.c_str());
    if (!dir) {
        return unexpected{last_error(*state_, "cannot open directory " + path)};
    }

    std::vector<remote_entry> entries;
    char name[512];
    char longentry[1024];
    for (;;) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        int rc = libssh2_sftp_readdir_ex(dir, name, sizeof(name), longentry,
                                         sizeof(longentry), &attrs);
        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            auto err = last_error(*state_, "cannot read directory " + path);
            libssh2_sftp_closedir(dir);
            return unexpected{err};
        }

        std::string entry_name(name, static_cast<size_t>(rc));
        if (entry_name == "." || entry_name == "..") {
            continue;
        }
        auto st = from_attributes(attrs);
        entries.push_back(remote_entry{entry_name, st.size, st.modified_time, st.is_directory});
    }

    libssh2_sftp_closedir(dir);
    return entries;
}

auto sftp_channel::stat(const std::string& path) -> result<std::optional<remote_stat>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    int rc = libssh2_sftp_stat_ex(state_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                  LIBSSH2_SFTP_STAT, &attrs);
    if (rc != 0) {
        auto err = last_error(*state_, "cannot stat " + path);
        if (err.code == error_code::path_not_found) {
            return std::optional<remote_stat>{};
        }
        return unexpected{err};
    }
    return std::optional<remote_stat>{from_attributes(attrs)};
}

auto sftp_channel::open_read(const std::string& path, uint64_t offset)
    -> result<std::unique_ptr<read_stream>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    LIBSSH2_SFTP_HANDLE* handle =
        libssh2_sftp_open_ex(state_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!handle) {
        return unexpected{last_error(*state_, "cannot open " + path + " for reading")};
    }
    if (offset > 0) {
        libssh2_sftp_seek64(handle, static_cast<libssh2_uint64_t>(offset));
    }
    return std::unique_ptr<read_stream>(std::make_unique<sftp_read_stream>(state_, handle));
}

auto sftp_channel::open_write(const std::string& path, write_mode mode)
    -> result<std::unique_ptr<write_stream>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
    if (mode == write_mode::truncate) {
        flags |= LIBSSH2_FXF_TRUNC;
    }

    LIBSSH2_SFTP_HANDLE* handle =
        libssh2_sftp_open_ex(state_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                             flags, default_file_mode, LIBSSH2_SFTP_OPENFILE);
    if (!handle) {
        return unexpected{last_error(*state_, "cannot open " + path + " for writing")};
    }

    // Servers differ on FXF_APPEND, so position explicitly at the current end.
    if (mode == write_mode::append) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        if (libssh2_sftp_fstat_ex(handle, &attrs, 0) != 0) {
            auto err = last_error(*state_, "cannot stat " + path);
            libssh2_sftp_close(handle);
            return unexpected{err};
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
            libssh2_sftp_seek64(handle, attrs.filesize);
        }
    }
    return std::unique_ptr<write_stream>(std::make_unique<sftp_write_stream>(state_, handle));
}

auto sftp_channel::rename(const std::string& from, const std::string& to) -> result<void> {
    if (auto valid = validate_remote_path(from); !valid) {
        return valid;
    }
    if (auto valid = validate_remote_path(to); !valid) {
        return valid;
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    auto do_rename = [&] {
        return libssh2_sftp_rename_ex(
            state_->sftp, from.c_str(), static_cast<unsigned>(from.size()), to.c_str(),
            static_cast<unsigned>(to.size()),
            LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC |
                LIBSSH2_SFTP_RENAME_NATIVE);
    };

    if (do_rename() == 0) {
        return {};
    }

    // SFTPv3 servers ignore the overwrite flag and refuse an existing target.
    auto existing = stat(to);
    if (!existing) {
        return unexpected{existing.error()};
    }
    if (existing.value() && !existing.value()->is_directory) {
        if (libssh2_sftp_unlink_ex(state_->sftp, to.c_str(), static_cast<unsigned>(to.size())) ==
                0 &&
            do_rename() == 0) {
            return {};
        }
    }
    return unexpected{last_error(*state_, "cannot rename " + from + " to " + to)};
}

auto sftp_channel::remove(const std::string& path) -> result<void> {
    if (auto valid = validate_remote_path(path); !valid) {
        return valid;
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    if (libssh2_sftp_unlink_ex(state_->sftp, path.c_str(), static_cast<unsigned>(path.size())) ==
        0) {
        return {};
    }
    if (libssh2_sftp_rmdir_ex(state_->sftp, path.c_str(), static_cast<unsigned>(path.size())) ==
        0) {
        return {};
    }
    return unexpected{last_error(*state_, "cannot remove " + path)};
}

auto sftp_channel::make_directory(const std::string& path) -> result<void> {
    if (auto valid = validate_remote_path(path); !valid) {
        return valid;
    }
    if (!state_->open) {
        return closed_error(*state_);
    }

    if (libssh2_sftp_mkdir_ex(state_->sftp, path.c_str(), static_cast<unsigned>(path.size()),
                              default_dir_mode) == 0) {
        return {};
    }
    auto err = last_error(*state_, "cannot create directory " + path);
    if (!is_connection_loss(err.code)) {
        auto existing = stat(path);
        if (existing && existing.value() && existing.value()->is_directory) {
            return {};
        }
    }
    return unexpected{err};
}

auto sftp_channel::keepalive() -> result<void> {
    if (!state_->open) {
        return closed_error(*state_);
    }
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat_ex(state_->sftp, ".", 1, LIBSSH2_SFTP_STAT, &attrs) != 0) {
        auto err = last_error(*state_, "keepalive failed");
        if (!is_connection_loss(err.code)) {
            err.code = error_code::host_unreachable;
            state_->open = false;
        }
        return unexpected{err};
    }
    return {};
}

auto sftp_channel::is_open() const -> bool {
    return state_->open;
}

auto sftp_channel::close() -> result<void> {
    if (state_->open.exchange(false)) {
        ::shutdown(state_->sock.get(), SHUT_RDWR);
        DB_LOG_DEBUG(log_category::channel, "Closed SFTP session " + state_->label);
    }
    return {};
}

// ============================================================================
// sftp_connector
// ============================================================================

sftp_connector::sftp_connector() {
    std::call_once(libssh2_init_flag, [] { libssh2_init_rc = libssh2_init(0); });
}

sftp_connector::~sftp_connector() = default;

auto sftp_connector::open(const connection_request& request,
                          const host_trust_callback& on_unknown_host)
    -> result<std::unique_ptr<secure_channel>> {
    if (libssh2_init_rc != 0) {
        return unexpected{error{error_code::internal_error, "libssh2_init failed"}};
    }

    const auto& target = request.address.empty() ? request.host : request.address;
    auto sock = tcp_connect(target, request.port, request.timeout);
    if (!sock) {
        return unexpected{sock.error()};
    }

    auto state = std::make_shared<sftp_session_state>();
    state->sock = std::move(sock.value());
    state->label = request.username + "@" + target + ":" + std::to_string(request.port);

    state->session = libssh2_session_init();
    if (!state->session) {
        return unexpected{error{error_code::internal_error, "libssh2_session_init failed"}};
    }
    libssh2_session_set_blocking(state->session, 1);
    libssh2_session_set_timeout(state->session, static_cast<long>(request.timeout.count()));

    if (int rc = libssh2_session_handshake(state->session, state->sock.get()); rc != 0) {
        auto code = classify_session_rc(rc);
        if (code != error_code::timeout) {
            code = error_code::host_unreachable;
        }
        return unexpected{error{code, "SSH handshake with " + state->label + " failed: " +
                                          session_message(state->session)}};
    }

    if (auto trusted = verify_host_key(*state, request, on_unknown_host); !trusted) {
        return unexpected{trusted.error()};
    }

    if (auto authed = authenticate(*state, request); !authed) {
        return unexpected{authed.error()};
    }

    state->sftp = libssh2_sftp_init(state->session);
    if (!state->sftp) {
        auto code = classify_session_rc(libssh2_session_last_errno(state->session));
        if (!is_connection_loss(code)) {
            code = error_code::io_failure;
        }
        return unexpected{error{code, "SFTP subsystem unavailable on " + state->label}};
    }

    state->open = true;
    DB_LOG_INFO(log_category::channel, "SFTP session established: " + state->label);
    return std::unique_ptr<secure_channel>(std::make_unique<sftp_channel>(std::move(state)));
}

}  // namespace kcenon::deck_bridge

#endif  // DECK_BRIDGE_HAS_LIBSSH2
