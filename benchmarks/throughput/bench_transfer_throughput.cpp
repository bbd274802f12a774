/**
 * @file bench_transfer_throughput.cpp
 * @brief Benchmarks for transfer_engine throughput over a loopback channel
 *
 * The device side is a local directory, so the numbers are the engine's
 * own ceiling: chunk loop, temp file handling, progress events and the
 * channel lock. Real SFTP throughput is bounded by the link instead.
 */

#include <benchmark/benchmark.h>

#include <kcenon/deck_bridge/core/path_utils.h>
#include <kcenon/deck_bridge/core/statistics_collector.h>
#include <kcenon/deck_bridge/transfer/transfer_engine.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <filesystem>
#include <memory>

namespace kcenon::deck_bridge::benchmark {

using namespace std::chrono_literals;

namespace {

void label_throughput(::benchmark::State& state,
                      std::size_t bytes_per_iteration,
                      std::chrono::steady_clock::duration elapsed) {
    auto seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds <= 0.0 || state.iterations() == 0) {
        return;
    }
    auto total = static_cast<double>(bytes_per_iteration) * static_cast<double>(state.iterations());
    state.SetLabel(format_throughput(total / seconds));
}

auto make_engine(std::size_t chunk_size, const std::shared_ptr<channel_provider>& provider)
    -> std::unique_ptr<transfer_engine> {
    transfer_config config;
    config.chunk_size = chunk_size;
    config.availability_poll = 1ms;
    auto built = transfer_engine::builder().with_config(config).with_channel_provider(provider).build();
    if (!built) {
        return nullptr;
    }
    return std::make_unique<transfer_engine>(std::move(built).value());
}

}  // namespace

/**
 * @brief Upload one file; Arg 0 is the file size, Arg 1 the chunk size
 */
static void BM_Upload_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto source = temp_files.create_random_file("source.bin", file_size, 42);
    auto device_root = temp_files.base_dir() / "device";
    std::filesystem::create_directories(device_root / "home" / "deck");

    auto provider = std::make_shared<loopback_provider>(device_root);
    auto engine = make_engine(chunk_size, provider);
    if (!engine) {
        state.SkipWithError("Failed to build transfer engine");
        return;
    }

    auto started = std::chrono::steady_clock::now();
    for (auto _ : state) {
        auto id = engine->enqueue(transfer_request::upload(
            source.string(), "/home/deck/source.bin", overwrite_policy::overwrite));
        if (!id) {
            state.SkipWithError("enqueue failed");
            return;
        }
        auto job = engine->wait_for_job(id.value(), 60s);
        if (!job || job.value().status != transfer_status::completed) {
            state.SkipWithError("upload did not complete");
            return;
        }
        engine->clear_history();
    }

    label_throughput(state, file_size, std::chrono::steady_clock::now() - started);
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                             ::benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_Upload_SingleFile)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Download one file with the default chunk size
 */
static void BM_Download_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    temp_files.create_random_file("device/home/deck/clip.mp4", file_size, 42);
    auto target = temp_files.base_dir() / "local" / "clip.mp4";

    auto provider = std::make_shared<loopback_provider>(temp_files.base_dir() / "device");
    auto engine = make_engine(sizes::default_chunk, provider);
    if (!engine) {
        state.SkipWithError("Failed to build transfer engine");
        return;
    }

    auto started = std::chrono::steady_clock::now();
    for (auto _ : state) {
        auto id = engine->enqueue(transfer_request::download(
            "/home/deck/clip.mp4", target.string(), overwrite_policy::overwrite));
        if (!id) {
            state.SkipWithError("enqueue failed");
            return;
        }
        auto job = engine->wait_for_job(id.value(), 60s);
        if (!job || job.value().status != transfer_status::completed) {
            state.SkipWithError("download did not complete");
            return;
        }
        engine->clear_history();
    }

    label_throughput(state, file_size, std::chrono::steady_clock::now() - started);
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Download_SingleFile)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Upload a directory of many small files
 */
static void BM_Upload_Directory(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_size = 16 * sizes::KB;

    temp_file_manager temp_files;
    auto tree = temp_files.create_tree("saves", file_count, file_size);
    auto device_root = temp_files.base_dir() / "device";
    std::filesystem::create_directories(device_root / "home" / "deck");

    auto provider = std::make_shared<loopback_provider>(device_root);
    auto engine = make_engine(sizes::default_chunk, provider);
    if (!engine) {
        state.SkipWithError("Failed to build transfer engine");
        return;
    }

    for (auto _ : state) {
        auto id = engine->enqueue(
            transfer_request::upload(tree.string(), "/home/deck/saves", overwrite_policy::overwrite));
        if (!id) {
            state.SkipWithError("enqueue failed");
            return;
        }
        auto job = engine->wait_for_job(id.value(), 60s);
        if (!job || job.value().status != transfer_status::completed) {
            state.SkipWithError("directory upload did not complete");
            return;
        }
        engine->clear_history();
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Upload_Directory)->Arg(100)->Arg(1000)->Unit(::benchmark::kMillisecond)->UseRealTime();

/**
 * @brief Per-chunk cost of rate and ETA bookkeeping
 */
static void BM_Statistics_RecordChunk(::benchmark::State& state) {
    statistics_collector stats;
    stats.start(static_cast<uint64_t>(sizes::large_file) * 1000, 0);

    for (auto _ : state) {
        stats.record_chunk(sizes::default_chunk);
        ::benchmark::DoNotOptimize(stats.get_transfer_rate());
        ::benchmark::DoNotOptimize(stats.get_eta());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Statistics_RecordChunk);

/**
 * @brief Cost of validating a remote path before each channel call
 */
static void BM_ValidateRemotePath(::benchmark::State& state) {
    const std::string path = "/home/deck/.local/share/Steam/steamapps/compatdata/1234/pfx/drive_c";

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(validate_remote_path(path));
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ValidateRemotePath);

}  // namespace kcenon::deck_bridge::benchmark

BENCHMARK_MAIN();
