/**
 * @file sftp_channel.h
 * @brief secure_channel over SFTP, implemented with libssh2
 *
 * Only compiled when deck_bridge is configured with libssh2
 * (DECK_BRIDGE_HAS_LIBSSH2).
 */

#ifndef KCENON_DECK_BRIDGE_CHANNEL_SFTP_CHANNEL_H
#define KCENON_DECK_BRIDGE_CHANNEL_SFTP_CHANNEL_H

#include "kcenon/deck_bridge/channel/secure_channel.h"
#include "kcenon/deck_bridge/config/feature_flags.h"

#if DECK_BRIDGE_HAS_LIBSSH2

namespace kcenon::deck_bridge {

struct sftp_session_state;

/**
 * @brief One authenticated SSH session with an SFTP subsystem
 *
 * Streams opened from the channel share ownership of the session, so they
 * stay safe to destroy after close(); every call on them fails with
 * error_code::host_unreachable once the channel is closed.
 */
class sftp_channel : public secure_channel {
public:
    explicit sftp_channel(std::shared_ptr<sftp_session_state> state);
    ~sftp_channel() override;

    sftp_channel(const sftp_channel&) = delete;
    sftp_channel& operator=(const sftp_channel&) = delete;

    [[nodiscard]] auto list_directory(const std::string& path)
        -> result<std::vector<remote_entry>> override;
    [[nodiscard]] auto stat(const std::string& path)
        -> result<std::optional<remote_stat>> override;
    [[nodiscard]] auto open_read(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<read_stream>> override;
    [[nodiscard]] auto open_write(const std::string& path, write_mode mode)
        -> result<std::unique_ptr<write_stream>> override;
    [[nodiscard]] auto rename(const std::string& from, const std::string& to)
        -> result<void> override;
    [[nodiscard]] auto remove(const std::string& path) -> result<void> override;
    [[nodiscard]] auto make_directory(const std::string& path) -> result<void> override;
    [[nodiscard]] auto keepalive() -> result<void> override;
    [[nodiscard]] auto is_open() const -> bool override;
    [[nodiscard]] auto close() -> result<void> override;

private:
    std::shared_ptr<sftp_session_state> state_;
};

/**
 * @brief Opens sftp_channel instances
 *
 * TCP connect with the request timeout, SSH handshake, known_hosts check,
 * then public key or password authentication.
 */
class sftp_connector : public channel_connector {
public:
    sftp_connector();
    ~sftp_connector() override;

    [[nodiscard]] auto open(const connection_request& request,
                            const host_trust_callback& on_unknown_host)
        -> result<std::unique_ptr<secure_channel>> override;
};

}  // namespace kcenon::deck_bridge

#endif  // DECK_BRIDGE_HAS_LIBSSH2

#endif  // KCENON_DECK_BRIDGE_CHANNEL_SFTP_CHANNEL_H
