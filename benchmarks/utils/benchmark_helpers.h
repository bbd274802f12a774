/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_DECK_BRIDGE_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_DECK_BRIDGE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <kcenon/deck_bridge/channel/local_channel.h>

namespace kcenon::deck_bridge::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @param base_dir Base directory for temporary files; a fresh directory
     *        under the system temp path when empty
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    temp_file_manager(temp_file_manager&&) noexcept;
    auto operator=(temp_file_manager&&) noexcept -> temp_file_manager&;

    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create @p count files of @p file_size bytes under @p name
     *
     * Files are spread over two levels of subdirectories.
     */
    auto create_tree(const std::string& name, std::size_t count, std::size_t file_size)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief channel_provider over a local_channel, always available
 *
 * Stands in for a connected device so benchmarks measure the transfer
 * engine itself.
 */
class loopback_provider : public channel_provider {
public:
    explicit loopback_provider(std::filesystem::path device_root);

    [[nodiscard]] auto is_channel_available() const -> bool override;

    [[nodiscard]] auto use_channel(const std::function<result<void>(secure_channel&)>& operation)
        -> result<void> override;

private:
    std::mutex mutex_;
    local_channel channel_;
};

/**
 * @brief Format throughput as human-readable string (e.g. "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 256 * KB;
constexpr std::size_t max_chunk = 1 * MB;
}  // namespace sizes

}  // namespace kcenon::deck_bridge::benchmark

#endif  // KCENON_DECK_BRIDGE_BENCHMARKS_BENCHMARK_HELPERS_H
