/**
 * @file secure_channel.h
 * @brief Authenticated file session abstraction and its seams
 *
 * secure_channel is what the connection manager owns and the transfer
 * engine drives. Backends: local_channel (a directory on this machine) and
 * sftp_channel (libssh2).
 */

#ifndef KCENON_DECK_BRIDGE_CHANNEL_SECURE_CHANNEL_H
#define KCENON_DECK_BRIDGE_CHANNEL_SECURE_CHANNEL_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief One directory listing entry
 */
struct remote_entry {
    std::string name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified_time{};
    bool is_directory = false;
};

/**
 * @brief Attributes of an existing remote path
 */
struct remote_stat {
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified_time{};
    bool is_directory = false;
};

/**
 * @brief Sequential reader over a remote file
 */
class read_stream {
public:
    virtual ~read_stream() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Bytes read; 0 at end of file
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief Sequential writer into a remote file
 */
class write_stream {
public:
    virtual ~write_stream() = default;

    /**
     * @brief Write the whole buffer
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Flush and release the handle
     *
     * Must be called to learn whether buffered data reached the file; the
     * destructor closes silently.
     */
    [[nodiscard]] virtual auto close() -> result<void> = 0;
};

enum class write_mode {
    truncate,  ///< create or empty the file
    append     ///< create or continue at the current end
};

/**
 * @brief Authenticated session exposing directory and file operations
 *
 * Implementations are not required to be thread-safe; the connection
 * manager serializes all access under one lock.
 */
class secure_channel {
public:
    virtual ~secure_channel() = default;

    [[nodiscard]] virtual auto list_directory(const std::string& path)
        -> result<std::vector<remote_entry>> = 0;

    /**
     * @return std::nullopt when the path does not exist
     */
    [[nodiscard]] virtual auto stat(const std::string& path)
        -> result<std::optional<remote_stat>> = 0;

    [[nodiscard]] virtual auto open_read(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<read_stream>> = 0;

    [[nodiscard]] virtual auto open_write(const std::string& path, write_mode mode)
        -> result<std::unique_ptr<write_stream>> = 0;

    /**
     * @brief Atomically rename, replacing an existing destination
     */
    [[nodiscard]] virtual auto rename(const std::string& from, const std::string& to)
        -> result<void> = 0;

    [[nodiscard]] virtual auto remove(const std::string& path) -> result<void> = 0;

    /**
     * @brief Create a directory; succeeds when it already exists
     */
    [[nodiscard]] virtual auto make_directory(const std::string& path) -> result<void> = 0;

    /**
     * @brief Cheap round trip proving the session is alive
     */
    [[nodiscard]] virtual auto keepalive() -> result<void> = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    [[nodiscard]] virtual auto close() -> result<void> = 0;
};

// ============================================================================
// Opening channels
// ============================================================================

enum class auth_method {
    key,
    password
};

/**
 * @brief Everything a connector needs to open one channel
 */
struct connection_request {
    std::string host;
    std::string address;
    uint16_t port = 22;
    std::string username = "deck";
    auth_method method = auth_method::key;
    std::vector<std::string> key_paths;  ///< tried in order
    std::string password;                ///< used when method == password
    std::string known_hosts_path;
    std::chrono::milliseconds timeout{15000};
};

/**
 * @brief Server key presented during the handshake
 */
struct host_identity {
    std::string host;
    uint16_t port = 22;
    std::string key_type;
    std::string fingerprint;  ///< "SHA256:<base64>"
};

enum class trust_decision {
    reject,
    accept_once,
    accept_and_remember
};

/**
 * @brief Asked by a connector when the server key is not in known_hosts
 *
 * Blocks until the caller decides. Never invoked for a key that conflicts
 * with a known_hosts entry; that is always error_code::untrusted_host.
 */
using host_trust_callback = std::function<trust_decision(const host_identity&)>;

/**
 * @brief Factory for channels
 */
class channel_connector {
public:
    virtual ~channel_connector() = default;

    /**
     * @brief Connect, verify the host key and authenticate
     *
     * Failures are classified: authentication_failure, untrusted_host,
     * timeout, host_unreachable.
     */
    [[nodiscard]] virtual auto open(const connection_request& request,
                                    const host_trust_callback& on_unknown_host)
        -> result<std::unique_ptr<secure_channel>> = 0;
};

/**
 * @brief Serialized access to the active channel
 *
 * Implemented by connection_manager; consumed by transfer_engine.
 */
class channel_provider {
public:
    virtual ~channel_provider() = default;

    [[nodiscard]] virtual auto is_channel_available() const -> bool = 0;

    /**
     * @brief Run @p operation with exclusive access to the channel
     *
     * Fails with error_code::host_unreachable when no channel is connected.
     * The operation's own error is passed through.
     */
    [[nodiscard]] virtual auto use_channel(
        const std::function<result<void>(secure_channel&)>& operation) -> result<void> = 0;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CHANNEL_SECURE_CHANNEL_H
