/**
 * @file transfer_engine.cpp
 * @brief Sequential, resumable transfer queue implementation
 */

#include "kcenon/deck_bridge/transfer/transfer_engine.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include "kcenon/deck_bridge/core/event_queue.h"
#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/path_utils.h"
#include "kcenon/deck_bridge/core/statistics_collector.h"

namespace kcenon::deck_bridge {

namespace fs = std::filesystem;

namespace {

enum class job_outcome {
    completed,
    skipped
};

auto fs_error(const std::error_code& ec, const std::string& what) -> unexpected {
    return unexpected{error{from_errno(ec.value()), what + ": " + ec.message()}};
}

auto errno_error(const std::string& what) -> unexpected {
    int err = errno;
    auto code = err != 0 ? from_errno(err) : error_code::io_failure;
    return unexpected{error{code, what}};
}

auto cancelled_error() -> unexpected {
    return unexpected{error{error_code::cancelled, "transfer cancelled"}};
}

/**
 * @brief Stream that is destroyed under the channel lock when possible
 */
template <typename Stream>
class channel_bound {
public:
    channel_bound(channel_provider& provider, std::unique_ptr<Stream> stream)
        : provider_(provider), stream_(std::move(stream)) {}

    channel_bound(const channel_bound&) = delete;
    auto operator=(const channel_bound&) -> channel_bound& = delete;

    ~channel_bound() { release(); }

    auto operator->() -> Stream* { return stream_.get(); }

    void release() {
        if (!stream_) {
            return;
        }
        auto released = provider_.use_channel([this](secure_channel&) -> result<void> {
            stream_.reset();
            return {};
        });
        if (!released) {
            // Channel already gone; the handle died with it.
            stream_.reset();
        }
    }

private:
    channel_provider& provider_;
    std::unique_ptr<Stream> stream_;
};

struct remote_file {
    std::string remote;
    uint64_t size = 0;
    fs::path local;
};

}  // namespace

// ============================================================================
// transfer_engine::impl
// ============================================================================

struct transfer_engine::impl {
    struct job_entry {
        transfer_job job;
        std::atomic<bool> cancel{false};
        std::optional<overwrite_decision> answer;
    };

    /// Worker-side state of the job being executed
    struct job_run {
        job_entry& entry;
        statistics_collector stats;
        uint64_t base = 0;  ///< bytes of files already finished in this job
    };

    transfer_config config;
    std::shared_ptr<channel_provider> provider;
    event_dispatcher<transfer_event> events{"transfer_events"};

    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    std::unordered_map<job_id, std::unique_ptr<job_entry>> jobs;
    std::deque<job_id> queue;
    std::vector<job_id> finished;
    std::optional<job_id> active;
    uint64_t next_id{1};
    bool stopping{false};

    std::thread worker;

    impl(transfer_config cfg, std::shared_ptr<channel_provider> p)
        : config(std::move(cfg)), provider(std::move(p)) {}

    // ------------------------------------------------------------------
    // Events
    // ------------------------------------------------------------------

    auto make_event(transfer_event_type type, const transfer_job& job) const -> transfer_event {
        transfer_event event;
        event.type = type;
        event.id = job.id;
        event.status = job.status;
        event.bytes_transferred = job.bytes_transferred;
        event.total_bytes = job.total_bytes;
        return event;
    }

    void end_locked(job_entry& entry, transfer_status status, std::optional<error> failure) {
        auto& job = entry.job;
        job.status = status;
        job.last_error = std::move(failure);
        job.finished_at = std::chrono::system_clock::now();
        finished.push_back(job.id);

        auto event = make_event(transfer_event_type::job_terminal, job);
        if (job.last_error) {
            event.error_kind = job.last_error->code;
            event.message = job.last_error->message;
        }
        events.publish(std::move(event));
        cv.notify_all();
    }

    void cancel_queued_locked(job_entry& entry) {
        queue.erase(std::remove(queue.begin(), queue.end(), entry.job.id), queue.end());
        end_locked(entry, transfer_status::cancelled,
                   error{error_code::cancelled, "cancelled before start"});
    }

    // ------------------------------------------------------------------
    // Progress
    // ------------------------------------------------------------------

    void set_totals(job_run& run, uint64_t total, std::size_t files) {
        std::lock_guard<std::mutex> lock(mutex);
        run.entry.job.total_bytes = total;
        run.entry.job.files_total = files;
        run.stats.start(total, 0);
    }

    void note_resume(job_run& run, const std::string& path, uint64_t offset) {
        if (offset == 0) {
            return;
        }
        // Resumed bytes count towards progress but not towards the rate.
        run.stats.start(run.entry.job.total_bytes, run.base + offset);
        {
            std::lock_guard<std::mutex> lock(mutex);
            run.entry.job.resume_offset += offset;
        }

        bridge_log_context ctx;
        ctx.job_id = run.entry.job.id.value;
        ctx.path = path;
        ctx.bytes_transferred = offset;
        DB_LOG_INFO_CTX(log_category::transfer, "Resuming from partial temp file", ctx);
    }

    void report(job_run& run, uint64_t file_bytes) {
        std::lock_guard<std::mutex> lock(mutex);
        auto& job = run.entry.job;
        job.bytes_transferred = std::max(job.bytes_transferred, run.base + file_bytes);

        auto event = make_event(transfer_event_type::job_progress, job);
        event.speed = run.stats.get_transfer_rate();
        auto eta = run.stats.get_eta();
        if (eta) {
            event.eta = std::chrono::duration_cast<std::chrono::milliseconds>(*eta);
        }
        events.publish(std::move(event));
    }

    void file_done(job_run& run, uint64_t bytes) {
        run.base += bytes;
        std::lock_guard<std::mutex> lock(mutex);
        ++run.entry.job.files_done;
    }

    // ------------------------------------------------------------------
    // Channel access
    // ------------------------------------------------------------------

    template <typename F>
    auto on_channel(F&& op) -> decltype(op(std::declval<secure_channel&>())) {
        using outcome_type = decltype(op(std::declval<secure_channel&>()));
        std::optional<outcome_type> out;
        auto done = provider->use_channel([&](secure_channel& channel) -> result<void> {
            out.emplace(op(channel));
            if (!out->has_value()) {
                return unexpected{out->error()};
            }
            return {};
        });
        if (!done) {
            return unexpected{done.error()};
        }
        return std::move(*out);
    }

    // ------------------------------------------------------------------
    // Overwrite questions
    // ------------------------------------------------------------------

    /**
     * @return true to proceed, false to skip
     */
    auto resolve_overwrite(job_run& run, const std::string& path) -> result<bool> {
        auto& entry = run.entry;
        switch (entry.job.overwrite) {
            case overwrite_policy::overwrite:
                return true;
            case overwrite_policy::skip:
                return false;
            case overwrite_policy::ask:
                break;
        }

        std::unique_lock<std::mutex> lock(mutex);
        entry.answer.reset();
        entry.job.status = transfer_status::paused_resumable;
        auto event = make_event(transfer_event_type::overwrite_decision_needed, entry.job);
        event.path = path;
        event.message = "destination exists";
        events.publish(std::move(event));

        cv.wait(lock, [&] { return entry.answer.has_value() || entry.cancel.load() || stopping; });

        if (!entry.answer) {
            return cancelled_error();
        }
        auto decision = *entry.answer;
        entry.answer.reset();
        entry.job.status = transfer_status::active;
        return decision == overwrite_decision::overwrite;
    }

    // ------------------------------------------------------------------
    // Single files
    // ------------------------------------------------------------------

    auto upload_file(job_run& run, const fs::path& local, const std::string& remote, bool ask)
        -> result<job_outcome> {
        auto valid = validate_remote_path(remote);
        if (!valid) {
            return unexpected{valid.error()};
        }

        std::error_code ec;
        uint64_t size = fs::file_size(local, ec);
        if (ec) {
            return fs_error(ec, "cannot stat " + local.string());
        }

        if (ask) {
            auto existing = on_channel([&](secure_channel& ch) { return ch.stat(remote); });
            if (!existing) {
                return unexpected{existing.error()};
            }
            if (existing.value()) {
                auto proceed = resolve_overwrite(run, remote);
                if (!proceed) {
                    return unexpected{proceed.error()};
                }
                if (!proceed.value()) {
                    return job_outcome::skipped;
                }
            }
        }

        const auto temp = temp_path_for(remote);
        auto partial = on_channel([&](secure_channel& ch) { return ch.stat(temp); });
        if (!partial) {
            return unexpected{partial.error()};
        }
        uint64_t offset = 0;
        if (partial.value() && !partial.value()->is_directory) {
            if (partial.value()->size <= size) {
                offset = partial.value()->size;
            } else {
                DB_LOG_WARN(log_category::transfer,
                            "Temp file larger than source, restarting " + temp);
            }
        }

        std::ifstream in(local, std::ios::binary);
        if (!in) {
            return errno_error("cannot open " + local.string());
        }
        if (offset > 0) {
            in.seekg(static_cast<std::streamoff>(offset));
            if (!in) {
                return errno_error("cannot seek " + local.string());
            }
        }

        auto opened = on_channel([&](secure_channel& ch) {
            return ch.open_write(temp, offset > 0 ? write_mode::append : write_mode::truncate);
        });
        if (!opened) {
            return unexpected{opened.error()};
        }
        channel_bound<write_stream> out(*provider, std::move(opened.value()));
        note_resume(run, remote, offset);

        std::vector<std::byte> buffer(config.chunk_size);
        uint64_t written = offset;
        report(run, written);

        for (;;) {
            if (run.entry.cancel) {
                return cancelled_error();
            }
            in.read(reinterpret_cast<char*>(buffer.data()),
                    static_cast<std::streamsize>(buffer.size()));
            auto count = static_cast<std::size_t>(in.gcount());
            if (in.bad()) {
                return errno_error("read failed on " + local.string());
            }
            if (count == 0) {
                break;
            }
            std::span<const std::byte> chunk(buffer.data(), count);
            auto sent = on_channel([&](secure_channel&) { return out->write(chunk); });
            if (!sent) {
                return unexpected{sent.error()};
            }
            written += count;
            run.stats.record_chunk(count);
            report(run, written);
        }

        auto closed = on_channel([&](secure_channel&) { return out->close(); });
        if (!closed) {
            return unexpected{closed.error()};
        }
        out.release();

        if (written != size) {
            return unexpected{error{error_code::io_failure,
                                    "source changed size during upload: " + local.string()}};
        }

        auto renamed = on_channel([&](secure_channel& ch) { return ch.rename(temp, remote); });
        if (!renamed) {
            return unexpected{renamed.error()};
        }
        file_done(run, written);
        return job_outcome::completed;
    }

    auto download_file(job_run& run,
                       const std::string& remote,
                       uint64_t size,
                       const fs::path& local,
                       bool ask) -> result<job_outcome> {
        auto valid = validate_remote_path(remote);
        if (!valid) {
            return unexpected{valid.error()};
        }

        std::error_code ec;
        if (ask && fs::exists(local, ec)) {
            auto proceed = resolve_overwrite(run, local.string());
            if (!proceed) {
                return unexpected{proceed.error()};
            }
            if (!proceed.value()) {
                return job_outcome::skipped;
            }
        }

        const fs::path temp(temp_path_for(local.string()));
        uint64_t offset = 0;
        if (fs::is_regular_file(temp, ec)) {
            auto partial = fs::file_size(temp, ec);
            if (!ec && partial <= size) {
                offset = partial;
            }
        }

        if (local.has_parent_path()) {
            fs::create_directories(local.parent_path(), ec);
            if (ec) {
                return fs_error(ec, "cannot create " + local.parent_path().string());
            }
        }

        auto opened = on_channel([&](secure_channel& ch) { return ch.open_read(remote, offset); });
        if (!opened) {
            return unexpected{opened.error()};
        }
        channel_bound<read_stream> in(*provider, std::move(opened.value()));

        auto mode = std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc);
        std::ofstream out(temp, mode);
        if (!out) {
            return errno_error("cannot open " + temp.string());
        }
        note_resume(run, remote, offset);

        std::vector<std::byte> buffer(config.chunk_size);
        uint64_t received = offset;
        report(run, received);

        for (;;) {
            if (run.entry.cancel) {
                return cancelled_error();
            }
            auto count = on_channel([&](secure_channel&) {
                return in->read(std::span<std::byte>(buffer.data(), buffer.size()));
            });
            if (!count) {
                return unexpected{count.error()};
            }
            if (count.value() == 0) {
                break;
            }
            out.write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(count.value()));
            if (!out) {
                return errno_error("write failed on " + temp.string());
            }
            received += count.value();
            run.stats.record_chunk(count.value());
            report(run, received);
        }

        out.close();
        if (out.fail()) {
            return errno_error("close failed on " + temp.string());
        }
        in.release();

        if (received != size) {
            return unexpected{error{error_code::io_failure,
                                    "remote file changed size during download: " + remote}};
        }

        fs::rename(temp, local, ec);
        if (ec) {
            return fs_error(ec, "cannot rename " + temp.string());
        }
        file_done(run, received);
        return job_outcome::completed;
    }

    // ------------------------------------------------------------------
    // Directories
    // ------------------------------------------------------------------

    auto upload_directory(job_run& run) -> result<job_outcome> {
        const fs::path root(run.entry.job.source_path);
        const std::string remote_root = run.entry.job.destination_path;

        std::vector<std::pair<fs::path, std::string>> files;
        std::vector<std::string> directories;
        uint64_t total = 0;

        std::error_code ec;
        for (auto it = fs::recursive_directory_iterator(root, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            auto remote = posix_join(remote_root, it->path().lexically_relative(root).generic_string());
            if (it->is_directory(ec)) {
                directories.push_back(std::move(remote));
            } else if (it->is_regular_file(ec)) {
                total += it->file_size(ec);
                files.emplace_back(it->path(), std::move(remote));
            }
            if (ec) {
                break;
            }
        }
        if (ec) {
            return fs_error(ec, "cannot walk " + root.string());
        }
        set_totals(run, total, files.size());

        auto existing = on_channel([&](secure_channel& ch) { return ch.stat(remote_root); });
        if (!existing) {
            return unexpected{existing.error()};
        }
        if (existing.value()) {
            auto proceed = resolve_overwrite(run, remote_root);
            if (!proceed) {
                return unexpected{proceed.error()};
            }
            if (!proceed.value()) {
                return job_outcome::skipped;
            }
        }

        auto made = on_channel([&](secure_channel& ch) { return ch.make_directory(remote_root); });
        if (!made) {
            return unexpected{made.error()};
        }
        // recursive_directory_iterator yields parents before children
        for (const auto& dir : directories) {
            if (run.entry.cancel) {
                return cancelled_error();
            }
            auto valid = validate_remote_path(dir);
            if (!valid) {
                return unexpected{valid.error()};
            }
            auto created = on_channel([&](secure_channel& ch) { return ch.make_directory(dir); });
            if (!created) {
                return unexpected{created.error()};
            }
        }

        for (const auto& [local, remote] : files) {
            if (run.entry.cancel) {
                return cancelled_error();
            }
            auto uploaded = upload_file(run, local, remote, false);
            if (!uploaded) {
                return uploaded;
            }
        }
        return job_outcome::completed;
    }

    auto collect_remote(const std::string& remote_dir,
                        const fs::path& local_dir,
                        std::vector<remote_file>& files,
                        std::vector<fs::path>& directories) -> result<void> {
        auto listing = on_channel([&](secure_channel& ch) { return ch.list_directory(remote_dir); });
        if (!listing) {
            return unexpected{listing.error()};
        }
        for (const auto& item : listing.value()) {
            if (item.name == "." || item.name == "..") {
                continue;
            }
            auto remote = posix_join(remote_dir, item.name);
            auto local = local_dir / item.name;
            if (item.is_directory) {
                directories.push_back(local);
                auto nested = collect_remote(remote, local, files, directories);
                if (!nested) {
                    return nested;
                }
            } else {
                files.push_back({std::move(remote), item.size, std::move(local)});
            }
        }
        return {};
    }

    auto download_directory(job_run& run) -> result<job_outcome> {
        const std::string remote_root = run.entry.job.source_path;
        const fs::path local_root(run.entry.job.destination_path);

        std::vector<remote_file> files;
        std::vector<fs::path> directories;
        auto collected = collect_remote(remote_root, local_root, files, directories);
        if (!collected) {
            return unexpected{collected.error()};
        }

        uint64_t total = 0;
        for (const auto& f : files) {
            total += f.size;
        }
        set_totals(run, total, files.size());

        std::error_code ec;
        if (fs::exists(local_root, ec)) {
            auto proceed = resolve_overwrite(run, local_root.string());
            if (!proceed) {
                return unexpected{proceed.error()};
            }
            if (!proceed.value()) {
                return job_outcome::skipped;
            }
        }

        fs::create_directories(local_root, ec);
        if (ec) {
            return fs_error(ec, "cannot create " + local_root.string());
        }
        for (const auto& dir : directories) {
            fs::create_directories(dir, ec);
            if (ec) {
                return fs_error(ec, "cannot create " + dir.string());
            }
        }

        for (const auto& f : files) {
            if (run.entry.cancel) {
                return cancelled_error();
            }
            auto downloaded = download_file(run, f.remote, f.size, f.local, false);
            if (!downloaded) {
                return downloaded;
            }
        }
        return job_outcome::completed;
    }

    // ------------------------------------------------------------------
    // Job execution
    // ------------------------------------------------------------------

    void set_kind(job_entry& entry, transfer_kind kind) {
        std::lock_guard<std::mutex> lock(mutex);
        entry.job.kind = kind;
    }

    auto execute(job_run& run) -> result<job_outcome> {
        const auto& job = run.entry.job;

        if (job.direction == transfer_direction::upload) {
            std::error_code ec;
            auto status = fs::status(job.source_path, ec);
            if (ec || !fs::exists(status)) {
                return unexpected{error{error_code::path_not_found,
                                        "local source not found: " + job.source_path}};
            }
            if (fs::is_directory(status)) {
                set_kind(run.entry, transfer_kind::directory);
                return upload_directory(run);
            }
            auto size = fs::file_size(job.source_path, ec);
            if (ec) {
                return fs_error(ec, "cannot stat " + job.source_path);
            }
            set_totals(run, size, 1);
            return upload_file(run, job.source_path, job.destination_path, true);
        }

        auto source = on_channel([&](secure_channel& ch) { return ch.stat(job.source_path); });
        if (!source) {
            return unexpected{source.error()};
        }
        if (!source.value()) {
            return unexpected{error{error_code::path_not_found,
                                    "remote source not found: " + job.source_path}};
        }
        if (source.value()->is_directory) {
            set_kind(run.entry, transfer_kind::directory);
            return download_directory(run);
        }
        set_totals(run, source.value()->size, 1);
        return download_file(run, job.source_path, source.value()->size,
                             fs::path(job.destination_path), true);
    }

    void finalize(job_run& run, const result<job_outcome>& outcome) {
        run.stats.stop();

        auto& job = run.entry.job;
        bridge_log_context ctx;
        ctx.job_id = job.id.value;
        ctx.path = job.destination_path;
        ctx.bytes_transferred = job.bytes_transferred;
        ctx.total_bytes = job.total_bytes;
        ctx.rate_mbps = run.stats.get_average_rate() / (1024.0 * 1024.0);

        std::lock_guard<std::mutex> lock(mutex);
        active.reset();
        if (outcome) {
            auto status = outcome.value() == job_outcome::completed ? transfer_status::completed
                                                                    : transfer_status::skipped;
            DB_LOG_INFO_CTX(log_category::transfer,
                            std::string("Transfer ") + to_string(status), ctx);
            end_locked(run.entry, status, std::nullopt);
            return;
        }

        const auto& failure = outcome.error();
        ctx.error_message = failure.message;
        if (failure.code == error_code::cancelled) {
            DB_LOG_INFO_CTX(log_category::transfer, "Transfer cancelled", ctx);
            end_locked(run.entry, transfer_status::cancelled, failure);
        } else {
            DB_LOG_ERROR_CTX(log_category::transfer, "Transfer failed", ctx);
            end_locked(run.entry, transfer_status::failed, failure);
        }
    }

    void run_job(job_entry& entry) {
        statistics_collector::config window{config.rate_window_size};
        job_run run{entry, statistics_collector(window), 0};

        bridge_log_context ctx;
        ctx.job_id = entry.job.id.value;
        ctx.path = entry.job.source_path;
        DB_LOG_INFO_CTX(log_category::transfer,
                        std::string("Starting ") + to_string(entry.job.direction), ctx);

        result<job_outcome> outcome = unexpected{error{error_code::internal_error}};
        try {
            outcome = execute(run);
        } catch (const std::exception& e) {
            outcome = unexpected{error{error_code::internal_error,
                                       std::string("transfer aborted: ") + e.what()}};
        }
        finalize(run, outcome);
    }

    void worker_loop() {
        get_logger().initialize();
        for (;;) {
            job_entry* entry = nullptr;
            {
                std::unique_lock<std::mutex> lock(mutex);
                while (!stopping && (queue.empty() || !provider->is_channel_available())) {
                    cv.wait_for(lock, config.availability_poll);
                }
                if (stopping) {
                    return;
                }
                auto id = queue.front();
                queue.pop_front();
                entry = jobs.at(id).get();
                active = id;
                entry->job.status = transfer_status::active;
                entry->job.started_at = std::chrono::system_clock::now();
                events.publish(make_event(transfer_event_type::job_progress, entry->job));
            }
            run_job(*entry);
        }
    }

    auto find_locked(job_id id) -> job_entry* {
        auto it = jobs.find(id);
        return it == jobs.end() ? nullptr : it->second.get();
    }
};

// ============================================================================
// transfer_engine::builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_config(const transfer_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto transfer_engine::builder::with_channel_provider(std::shared_ptr<channel_provider> provider)
    -> builder& {
    provider_ = std::move(provider);
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (!provider_) {
        return unexpected{error{error_code::invalid_configuration, "channel provider is required"}};
    }
    auto valid = validate(config_);
    if (!valid) {
        return unexpected{valid.error()};
    }
    return transfer_engine(config_, provider_);
}

// ============================================================================
// transfer_engine
// ============================================================================

transfer_engine::transfer_engine(transfer_config config, std::shared_ptr<channel_provider> provider)
    : impl_(std::make_unique<impl>(std::move(config), std::move(provider))) {
    get_logger().initialize();
    impl_->worker = std::thread([state = impl_.get()] { state->worker_loop(); });
    DB_LOG_DEBUG(log_category::transfer, "Transfer engine started");
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&& other) noexcept -> transfer_engine& {
    if (this != &other) {
        if (impl_) {
            shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

transfer_engine::~transfer_engine() {
    if (impl_) {
        shutdown();
    }
}

auto transfer_engine::enqueue(const transfer_request& request) -> result<job_id> {
    if (request.source_path.empty() || request.destination_path.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "source and destination paths are required"}};
    }
    auto valid = validate_remote_path(request.remote_path());
    if (!valid) {
        bridge_log_context ctx;
        ctx.path = request.remote_path();
        ctx.error_message = valid.error().message;
        DB_LOG_WARN_CTX(log_category::transfer, "Rejected transfer request", ctx);
        return unexpected{valid.error()};
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->stopping) {
        return unexpected{error{error_code::cancelled, "transfer engine is shut down"}};
    }

    auto entry = std::make_unique<impl::job_entry>();
    auto& job = entry->job;
    job.id = job_id{impl_->next_id++};
    job.direction = request.direction;
    job.source_path = request.source_path;
    job.destination_path = request.destination_path;
    job.overwrite = request.overwrite;
    job.queued_at = std::chrono::system_clock::now();

    if (request.direction == transfer_direction::upload) {
        std::error_code ec;
        if (fs::is_directory(request.source_path, ec)) {
            job.kind = transfer_kind::directory;
        }
    }

    auto id = job.id;
    impl_->events.publish(impl_->make_event(transfer_event_type::job_queued, job));
    impl_->jobs.emplace(id, std::move(entry));
    impl_->queue.push_back(id);
    impl_->cv.notify_all();

    bridge_log_context ctx;
    ctx.job_id = id.value;
    ctx.path = request.remote_path();
    DB_LOG_DEBUG_CTX(log_category::transfer, "Job queued", ctx);
    return id;
}

auto transfer_engine::cancel(job_id id) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto* entry = impl_->find_locked(id);
    if (!entry) {
        return unexpected{error{error_code::job_not_found}};
    }
    if (is_terminal_status(entry->job.status)) {
        return unexpected{error{error_code::invalid_state_transition,
                                std::string("job already ") + to_string(entry->job.status)}};
    }
    if (entry->job.status == transfer_status::queued) {
        impl_->cancel_queued_locked(*entry);
        return {};
    }
    entry->cancel = true;
    impl_->cv.notify_all();
    return {};
}

auto transfer_engine::cancel_all() -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::size_t count = 0;
    auto queued = impl_->queue;
    for (auto id : queued) {
        impl_->cancel_queued_locked(*impl_->jobs.at(id));
        ++count;
    }
    if (impl_->active) {
        impl_->jobs.at(*impl_->active)->cancel = true;
        ++count;
    }
    impl_->cv.notify_all();
    return count;
}

auto transfer_engine::answer_overwrite(job_id id, overwrite_decision decision) -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto* entry = impl_->find_locked(id);
    if (!entry) {
        return unexpected{error{error_code::job_not_found}};
    }
    if (entry->job.status != transfer_status::paused_resumable || entry->answer) {
        return unexpected{error{error_code::invalid_state_transition,
                                "job is not waiting for an overwrite decision"}};
    }
    entry->answer = decision;
    impl_->cv.notify_all();
    return {};
}

auto transfer_engine::subscribe(listener fn) -> subscription_id {
    return impl_->events.subscribe(std::move(fn));
}

auto transfer_engine::unsubscribe(subscription_id id) -> bool {
    return impl_->events.unsubscribe(id);
}

auto transfer_engine::wait_for_events(std::chrono::milliseconds timeout) -> bool {
    return impl_->events.wait_idle(timeout);
}

auto transfer_engine::history() const -> std::vector<transfer_job> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<transfer_job> jobs;
    jobs.reserve(impl_->finished.size());
    for (auto id : impl_->finished) {
        jobs.push_back(impl_->jobs.at(id)->job);
    }
    return jobs;
}

void transfer_engine::clear_history() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto id : impl_->finished) {
        impl_->jobs.erase(id);
    }
    impl_->finished.clear();
}

auto transfer_engine::pending() const -> std::vector<transfer_job> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<transfer_job> jobs;
    if (impl_->active) {
        jobs.push_back(impl_->jobs.at(*impl_->active)->job);
    }
    for (auto id : impl_->queue) {
        jobs.push_back(impl_->jobs.at(id)->job);
    }
    return jobs;
}

auto transfer_engine::find(job_id id) const -> std::optional<transfer_job> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto* entry = impl_->find_locked(id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->job;
}

auto transfer_engine::wait_for_job(job_id id, std::chrono::milliseconds timeout) const
    -> result<transfer_job> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->cv.wait_for(lock, timeout, [&] {
        auto* entry = impl_->find_locked(id);
        return !entry || is_terminal_status(entry->job.status);
    });
    auto* entry = impl_->find_locked(id);
    if (!entry) {
        return unexpected{error{error_code::job_not_found}};
    }
    if (!is_terminal_status(entry->job.status)) {
        return unexpected{error{error_code::timeout, "job still running"}};
    }
    return entry->job;
}

void transfer_engine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->stopping) {
            impl_->stopping = true;
            auto queued = impl_->queue;
            for (auto id : queued) {
                impl_->cancel_queued_locked(*impl_->jobs.at(id));
            }
            if (impl_->active) {
                impl_->jobs.at(*impl_->active)->cancel = true;
            }
        }
        impl_->cv.notify_all();
    }
    if (impl_->worker.joinable()) {
        impl_->worker.join();
        DB_LOG_DEBUG(log_category::transfer, "Transfer engine stopped");
    }
    impl_->events.stop();
}

auto transfer_engine::config() const -> const transfer_config& {
    return impl_->config;
}

}  // namespace kcenon::deck_bridge
