/**
 * @file local_channel.h
 * @brief secure_channel backed by a directory on the local filesystem
 *
 * Remote paths are POSIX paths interpreted relative to a root directory, so
 * "/home/deck/file" maps to "<root>/home/deck/file". Used for the test
 * suites, the benchmarks and the examples when no device is around.
 */

#ifndef KCENON_DECK_BRIDGE_CHANNEL_LOCAL_CHANNEL_H
#define KCENON_DECK_BRIDGE_CHANNEL_LOCAL_CHANNEL_H

#include <filesystem>

#include "kcenon/deck_bridge/channel/secure_channel.h"

namespace kcenon::deck_bridge {

class local_channel : public secure_channel {
public:
    explicit local_channel(std::filesystem::path root);
    ~local_channel() override;

    local_channel(const local_channel&) = delete;
    local_channel& operator=(const local_channel&) = delete;

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

    /**
     * @brief Local filesystem location of a remote path
     */
    [[nodiscard]] auto resolve(const std::string& path) const -> std::filesystem::path;

private:
    std::filesystem::path root_;
    bool open_{true};
};

/**
 * @brief Connector that opens local_channel instances over one root
 */
class local_connector : public channel_connector {
public:
    explicit local_connector(std::filesystem::path root);

    [[nodiscard]] auto open(const connection_request& request,
                            const host_trust_callback& on_unknown_host)
        -> result<std::unique_ptr<secure_channel>> override;

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CHANNEL_LOCAL_CHANNEL_H
