/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for transfer_engine over a filesystem-backed channel
 */

#include <gtest/gtest.h>

#include <kcenon/deck_bridge/channel/local_channel.h>
#include <kcenon/deck_bridge/core/path_utils.h>
#include <kcenon/deck_bridge/transfer/transfer_engine.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::deck_bridge::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

/**
 * @brief channel_provider over a local_channel with an on/off switch
 */
class switchable_provider : public channel_provider {
public:
    explicit switchable_provider(fs::path root) : channel_(std::move(root)) {}

    void set_available(bool available) { available_ = available; }

    /**
     * @brief Drop the link after @p operations more channel calls
     */
    void fail_after(std::size_t operations) {
        std::lock_guard<std::mutex> lock(mutex_);
        budget_ = operations;
    }

    /**
     * @brief Call @p hook after each channel call that ran, with the running count
     */
    void after_each(std::function<void(std::size_t)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    auto is_channel_available() const -> bool override { return available_; }

    auto use_channel(const std::function<result<void>(secure_channel&)>& operation)
        -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (budget_) {
            if (*budget_ == 0) {
                available_ = false;
                budget_.reset();
            } else {
                --*budget_;
            }
        }
        if (!available_) {
            return unexpected{error{error_code::host_unreachable, "not connected"}};
        }
        auto outcome = operation(channel_);
        ++calls_;
        if (hook_) {
            hook_(calls_);
        }
        return outcome;
    }

private:
    std::mutex mutex_;
    std::atomic<bool> available_{true};
    std::optional<std::size_t> budget_;
    std::size_t calls_ = 0;
    std::function<void(std::size_t)> hook_;
    local_channel channel_;
};

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() /
                ("deck_bridge_transfer_" + std::to_string(std::random_device{}()));
        local_ = base_ / "local";
        remote_ = base_ / "remote";
        fs::create_directories(local_);
        fs::create_directories(remote_ / "home" / "deck");

        provider_ = std::make_shared<switchable_provider>(remote_);
        config_.chunk_size = 64 * 1024;
        config_.availability_poll = 10ms;
    }

    void TearDown() override {
        engine_.reset();
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    auto make_engine() -> transfer_engine& {
        auto built =
            transfer_engine::builder().with_config(config_).with_channel_provider(provider_).build();
        EXPECT_TRUE(built);
        engine_ = std::make_unique<transfer_engine>(std::move(built).value());
        (void)engine_->subscribe([this](const transfer_event& e) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(e);
        });
        return *engine_;
    }

    auto events_for(job_id id) -> std::vector<transfer_event> {
        EXPECT_TRUE(engine_->wait_for_events(2s));
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<transfer_event> out;
        for (const auto& e : events_) {
            if (e.id == id) {
                out.push_back(e);
            }
        }
        return out;
    }

    auto wait_for_status(job_id id, transfer_status status) -> bool {
        auto deadline = std::chrono::steady_clock::now() + 3s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto job = engine_->find(id);
            if (job && job->status == status) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    static auto pattern(std::size_t size, char seed = 'a') -> std::string {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>(seed + (i * 7) % 23);
        }
        return data;
    }

    static void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    static auto read_file(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    auto remote_file(const std::string& path) const -> fs::path {
        return remote_ / fs::path(path).relative_path();
    }

    fs::path base_;
    fs::path local_;
    fs::path remote_;
    std::shared_ptr<switchable_provider> provider_;
    transfer_config config_;
    std::unique_ptr<transfer_engine> engine_;

    std::mutex events_mutex_;
    std::vector<transfer_event> events_;
};

TEST_F(TransferEngineTest, BuilderRequiresProvider) {
    auto built = transfer_engine::builder().build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(TransferEngineTest, UploadsFile) {
    auto data = pattern(300 * 1024);
    write_file(local_ / "game.iso", data);
    auto& engine = make_engine();

    auto id = engine.enqueue(
        transfer_request::upload((local_ / "game.iso").string(), "/home/deck/game.iso"));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(job.value().bytes_transferred, data.size());
    ASSERT_TRUE(job.value().total_bytes.has_value());
    EXPECT_EQ(*job.value().total_bytes, data.size());
    EXPECT_EQ(job.value().resume_offset, 0u);
    EXPECT_EQ(job.value().files_done, 1u);
    EXPECT_TRUE(job.value().started_at.has_value());
    EXPECT_TRUE(job.value().finished_at.has_value());

    EXPECT_EQ(read_file(remote_file("/home/deck/game.iso")), data);
    EXPECT_FALSE(fs::exists(remote_file(temp_path_for("/home/deck/game.iso"))));
}

TEST_F(TransferEngineTest, DownloadsFile) {
    auto data = pattern(100 * 1024, 'k');
    write_file(remote_file("/home/deck/save.dat"), data);
    auto& engine = make_engine();

    auto target = local_ / "saves" / "save.dat";
    auto id = engine.enqueue(transfer_request::download("/home/deck/save.dat", target.string()));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(read_file(target), data);
    EXPECT_FALSE(fs::exists(temp_path_for(target.string())));
}

TEST_F(TransferEngineTest, MissingSourceFails) {
    auto& engine = make_engine();

    auto up = engine.enqueue(
        transfer_request::upload((local_ / "absent").string(), "/home/deck/absent"));
    auto down = engine.enqueue(
        transfer_request::download("/home/deck/absent", (local_ / "absent").string()));
    ASSERT_TRUE(up);
    ASSERT_TRUE(down);

    auto up_job = engine.wait_for_job(up.value(), 5s);
    ASSERT_TRUE(up_job);
    EXPECT_EQ(up_job.value().status, transfer_status::failed);
    ASSERT_TRUE(up_job.value().last_error.has_value());
    EXPECT_EQ(up_job.value().last_error->code, error_code::path_not_found);

    auto down_job = engine.wait_for_job(down.value(), 5s);
    ASSERT_TRUE(down_job);
    EXPECT_EQ(down_job.value().status, transfer_status::failed);
    EXPECT_EQ(down_job.value().last_error->code, error_code::path_not_found);
}

TEST_F(TransferEngineTest, TraversalRejectedAtEnqueue) {
    write_file(local_ / "a.txt", "x");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "a.txt").string(),
                                                      "../../etc/passwd"));
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, error_code::path_traversal_rejected);
    EXPECT_TRUE(engine.pending().empty());

    auto empty = engine.enqueue(transfer_request::upload("", "/home/deck/a.txt"));
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, error_code::invalid_configuration);
}

TEST_F(TransferEngineTest, WaitsForChannelBeforeStarting) {
    write_file(local_ / "a.txt", "payload");
    provider_->set_available(false);
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "a.txt").string(), "/home/deck/a.txt"));
    ASSERT_TRUE(id);

    std::this_thread::sleep_for(100ms);
    auto job = engine.find(id.value());
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, transfer_status::queued);
    ASSERT_EQ(engine.pending().size(), 1u);

    auto still = engine.wait_for_job(id.value(), 10ms);
    ASSERT_FALSE(still);
    EXPECT_EQ(still.error().code, error_code::timeout);

    provider_->set_available(true);
    auto done = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(done);
    EXPECT_EQ(done.value().status, transfer_status::completed);
    EXPECT_EQ(read_file(remote_file("/home/deck/a.txt")), "payload");
}

TEST_F(TransferEngineTest, JobsRunInQueueOrder) {
    write_file(local_ / "one", "1");
    write_file(local_ / "two", "22");
    provider_->set_available(false);
    auto& engine = make_engine();

    auto first = engine.enqueue(transfer_request::upload((local_ / "one").string(), "/home/deck/one"));
    auto second = engine.enqueue(transfer_request::upload((local_ / "two").string(), "/home/deck/two"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    auto pending = engine.pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, first.value());
    EXPECT_EQ(pending[1].id, second.value());

    provider_->set_available(true);
    ASSERT_TRUE(engine.wait_for_job(second.value(), 5s));

    auto history = engine.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, first.value());
    EXPECT_EQ(history[1].id, second.value());

    engine.clear_history();
    EXPECT_TRUE(engine.history().empty());
}

TEST_F(TransferEngineTest, EventsOrderedPerJob) {
    write_file(local_ / "big.bin", pattern(1024 * 1024));
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "big.bin").string(), "/home/deck/big.bin"));
    ASSERT_TRUE(id);
    ASSERT_TRUE(engine.wait_for_job(id.value(), 5s));

    auto events = events_for(id.value());
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().type, transfer_event_type::job_queued);
    EXPECT_EQ(events.back().type, transfer_event_type::job_terminal);
    EXPECT_EQ(events.back().status, transfer_status::completed);
    EXPECT_FALSE(events.back().error_kind.has_value());

    std::size_t progress = 0;
    uint64_t last = 0;
    for (const auto& e : events) {
        EXPECT_GE(e.bytes_transferred, last);
        last = e.bytes_transferred;
        if (e.type == transfer_event_type::job_progress) {
            ++progress;
        }
    }
    // 16 chunks of 64 KiB
    EXPECT_GE(progress, 16u);
    EXPECT_EQ(last, 1024u * 1024u);
}

TEST_F(TransferEngineTest, AskThenOverwrite) {
    write_file(local_ / "cfg.ini", "new");
    write_file(remote_file("/home/deck/cfg.ini"), "old");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "cfg.ini").string(), "/home/deck/cfg.ini"));
    ASSERT_TRUE(id);
    ASSERT_TRUE(wait_for_status(id.value(), transfer_status::paused_resumable));

    auto events = events_for(id.value());
    auto asked = std::find_if(events.begin(), events.end(), [](const transfer_event& e) {
        return e.type == transfer_event_type::overwrite_decision_needed;
    });
    ASSERT_NE(asked, events.end());
    EXPECT_EQ(asked->path, "/home/deck/cfg.ini");

    ASSERT_TRUE(engine.answer_overwrite(id.value(), overwrite_decision::overwrite));
    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(read_file(remote_file("/home/deck/cfg.ini")), "new");
}

TEST_F(TransferEngineTest, AskThenSkip) {
    write_file(local_ / "cfg.ini", "new");
    write_file(remote_file("/home/deck/cfg.ini"), "old");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "cfg.ini").string(), "/home/deck/cfg.ini"));
    ASSERT_TRUE(id);
    ASSERT_TRUE(wait_for_status(id.value(), transfer_status::paused_resumable));

    ASSERT_TRUE(engine.answer_overwrite(id.value(), overwrite_decision::skip));
    auto again = engine.answer_overwrite(id.value(), overwrite_decision::overwrite);
    EXPECT_FALSE(again);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::skipped);
    EXPECT_EQ(read_file(remote_file("/home/deck/cfg.ini")), "old");
}

TEST_F(TransferEngineTest, PolicySkipNeverAsks) {
    write_file(remote_file("/home/deck/save.dat"), "remote");
    write_file(local_ / "save.dat", "local");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::download(
        "/home/deck/save.dat", (local_ / "save.dat").string(), overwrite_policy::skip));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::skipped);
    EXPECT_EQ(read_file(local_ / "save.dat"), "local");

    for (const auto& e : events_for(id.value())) {
        EXPECT_NE(e.type, transfer_event_type::overwrite_decision_needed);
    }
}

TEST_F(TransferEngineTest, PolicyOverwriteReplacesLocalFile) {
    write_file(remote_file("/home/deck/save.dat"), "remote");
    write_file(local_ / "save.dat", "local");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::download(
        "/home/deck/save.dat", (local_ / "save.dat").string(), overwrite_policy::overwrite));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(read_file(local_ / "save.dat"), "remote");
}

TEST_F(TransferEngineTest, AnswerWithoutQuestionRejected) {
    auto& engine = make_engine();
    auto r = engine.answer_overwrite(job_id{42}, overwrite_decision::skip);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::job_not_found);
}

TEST_F(TransferEngineTest, CancelQueuedJob) {
    write_file(local_ / "a.txt", "x");
    provider_->set_available(false);
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "a.txt").string(), "/home/deck/a.txt"));
    ASSERT_TRUE(id);
    ASSERT_TRUE(engine.cancel(id.value()));

    auto job = engine.find(id.value());
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, transfer_status::cancelled);
    EXPECT_TRUE(engine.pending().empty());

    auto twice = engine.cancel(id.value());
    ASSERT_FALSE(twice);
    EXPECT_EQ(twice.error().code, error_code::invalid_state_transition);

    auto unknown = engine.cancel(job_id{999});
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, error_code::job_not_found);

    auto events = events_for(id.value());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, transfer_event_type::job_terminal);
    ASSERT_TRUE(events.back().error_kind.has_value());
    EXPECT_EQ(*events.back().error_kind, error_code::cancelled);
}

TEST_F(TransferEngineTest, CancelWhileAwaitingDecision) {
    write_file(local_ / "cfg.ini", "new");
    write_file(remote_file("/home/deck/cfg.ini"), "old");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "cfg.ini").string(), "/home/deck/cfg.ini"));
    ASSERT_TRUE(id);
    ASSERT_TRUE(wait_for_status(id.value(), transfer_status::paused_resumable));

    ASSERT_TRUE(engine.cancel(id.value()));
    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::cancelled);
    EXPECT_EQ(read_file(remote_file("/home/deck/cfg.ini")), "old");
}

TEST_F(TransferEngineTest, CancelAllClearsQueue) {
    write_file(local_ / "a.txt", "x");
    provider_->set_available(false);
    auto& engine = make_engine();

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(engine.enqueue(transfer_request::upload(
            (local_ / "a.txt").string(), "/home/deck/a" + std::to_string(i) + ".txt")));
    }
    EXPECT_EQ(engine.cancel_all(), 3u);
    EXPECT_TRUE(engine.pending().empty());
    EXPECT_EQ(engine.history().size(), 3u);
}

TEST_F(TransferEngineTest, UploadResumesFromRemoteTempFile) {
    auto data = pattern(200 * 1024);
    write_file(local_ / "rom.bin", data);
    write_file(remote_file(temp_path_for("/home/deck/rom.bin")), data.substr(0, 70000));
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "rom.bin").string(), "/home/deck/rom.bin"));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(job.value().resume_offset, 70000u);
    EXPECT_EQ(job.value().bytes_transferred, data.size());
    EXPECT_EQ(read_file(remote_file("/home/deck/rom.bin")), data);
}

TEST_F(TransferEngineTest, OversizedTempFileRestartsFromZero) {
    auto data = pattern(10 * 1024);
    write_file(local_ / "rom.bin", data);
    write_file(remote_file(temp_path_for("/home/deck/rom.bin")), pattern(20 * 1024, 'z'));
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "rom.bin").string(), "/home/deck/rom.bin"));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(job.value().resume_offset, 0u);
    EXPECT_EQ(read_file(remote_file("/home/deck/rom.bin")), data);
}

TEST_F(TransferEngineTest, DownloadResumesFromLocalTempFile) {
    auto data = pattern(150 * 1024, 'q');
    write_file(remote_file("/home/deck/clip.mp4"), data);
    auto target = local_ / "clip.mp4";
    write_file(temp_path_for(target.string()), data.substr(0, 4096));
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::download("/home/deck/clip.mp4", target.string()));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(job.value().resume_offset, 4096u);
    EXPECT_EQ(read_file(target), data);
}

TEST_F(TransferEngineTest, UploadsDirectoryTree) {
    write_file(local_ / "mods" / "a.txt", "alpha");
    write_file(local_ / "mods" / "sub" / "b.txt", "beta");
    fs::create_directories(local_ / "mods" / "empty");
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "mods").string(), "/home/deck/mods"));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(job.value().kind, transfer_kind::directory);
    EXPECT_EQ(job.value().files_total, 2u);
    EXPECT_EQ(job.value().files_done, 2u);
    EXPECT_EQ(job.value().bytes_transferred, 9u);

    EXPECT_EQ(read_file(remote_file("/home/deck/mods/a.txt")), "alpha");
    EXPECT_EQ(read_file(remote_file("/home/deck/mods/sub/b.txt")), "beta");
    EXPECT_TRUE(fs::is_directory(remote_file("/home/deck/mods/empty")));
}

TEST_F(TransferEngineTest, DownloadsDirectoryTree) {
    write_file(remote_file("/home/deck/screens/1.png"), "one");
    write_file(remote_file("/home/deck/screens/2024/2.png"), "two");
    auto& engine = make_engine();

    auto target = local_ / "screens";
    auto id = engine.enqueue(transfer_request::download("/home/deck/screens", target.string()));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::completed);
    EXPECT_EQ(job.value().kind, transfer_kind::directory);
    EXPECT_EQ(job.value().files_total, 2u);

    EXPECT_EQ(read_file(target / "1.png"), "one");
    EXPECT_EQ(read_file(target / "2024" / "2.png"), "two");
}

TEST_F(TransferEngineTest, ConnectionLossFailsJobAndKeepsTemp) {
    auto data = pattern(512 * 1024);
    write_file(local_ / "big.bin", data);
    auto& engine = make_engine();

    // stat dest, stat temp, open, then three chunk writes
    provider_->fail_after(6);

    auto id = engine.enqueue(transfer_request::upload((local_ / "big.bin").string(), "/home/deck/big.bin"));
    ASSERT_TRUE(id);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::failed);
    ASSERT_TRUE(job.value().last_error.has_value());
    EXPECT_EQ(job.value().last_error->code, error_code::host_unreachable);
    EXPECT_EQ(fs::file_size(remote_file(temp_path_for("/home/deck/big.bin"))), 3u * 64u * 1024u);
    EXPECT_FALSE(fs::exists(remote_file("/home/deck/big.bin")));
}

TEST_F(TransferEngineTest, CancelWhileStreamingKeepsPartialTemp) {
    constexpr std::size_t chunk = 64 * 1024;
    auto data = pattern(8 * chunk);
    write_file(local_ / "big.bin", data);
    provider_->set_available(false);
    auto& engine = make_engine();

    auto id = engine.enqueue(transfer_request::upload((local_ / "big.bin").string(), "/home/deck/big.bin"));
    ASSERT_TRUE(id);

    // stat dest, stat temp, open, then four chunk writes
    provider_->after_each([&engine, target = id.value()](std::size_t calls) {
        if (calls == 7) {
            EXPECT_TRUE(engine.cancel(target));
        }
    });
    provider_->set_available(true);

    auto job = engine.wait_for_job(id.value(), 5s);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().status, transfer_status::cancelled);
    ASSERT_TRUE(job.value().last_error.has_value());
    EXPECT_EQ(job.value().last_error->code, error_code::cancelled);
    EXPECT_EQ(job.value().bytes_transferred, 4u * chunk);
    EXPECT_LT(job.value().bytes_transferred, data.size());

    EXPECT_FALSE(fs::exists(remote_file("/home/deck/big.bin")));
    auto temp = remote_file(temp_path_for("/home/deck/big.bin"));
    ASSERT_TRUE(fs::exists(temp));
    EXPECT_EQ(fs::file_size(temp), job.value().bytes_transferred);
    EXPECT_EQ(read_file(temp), data.substr(0, 4 * chunk));

    auto again = engine.cancel(id.value());
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, error_code::invalid_state_transition);

    provider_->after_each(nullptr);
    auto resumed =
        engine.enqueue(transfer_request::upload((local_ / "big.bin").string(), "/home/deck/big.bin"));
    ASSERT_TRUE(resumed);
    auto finished = engine.wait_for_job(resumed.value(), 5s);
    ASSERT_TRUE(finished);
    EXPECT_EQ(finished.value().status, transfer_status::completed);
    EXPECT_EQ(finished.value().resume_offset, 4u * chunk);
    EXPECT_EQ(read_file(remote_file("/home/deck/big.bin")), data);
}

TEST_F(TransferEngineTest, OnlyOneJobRunsAtATime) {
    constexpr std::size_t jobs = 4;
    for (std::size_t i = 0; i < jobs; ++i) {
        write_file(local_ / ("part" + std::to_string(i)), pattern(3 * 64 * 1024, static_cast<char>('a' + i)));
    }
    provider_->set_available(false);
    auto& engine = make_engine();

    std::vector<job_id> ids;
    for (std::size_t i = 0; i < jobs; ++i) {
        auto name = "part" + std::to_string(i);
        auto id = engine.enqueue(transfer_request::upload((local_ / name).string(), "/home/deck/" + name));
        ASSERT_TRUE(id);
        ids.push_back(id.value());
    }

    std::atomic<std::size_t> most_running{0};
    std::atomic<std::size_t> samples{0};
    provider_->after_each([&engine, &most_running, &samples](std::size_t) {
        std::size_t running = 0;
        for (const auto& job : engine.pending()) {
            if (job.status == transfer_status::active ||
                job.status == transfer_status::paused_resumable) {
                ++running;
            }
        }
        ++samples;
        if (running > most_running) {
            most_running = running;
        }
    });
    provider_->set_available(true);

    ASSERT_TRUE(engine.wait_for_job(ids.back(), 10s));
    provider_->after_each(nullptr);

    EXPECT_GT(samples.load(), jobs);
    EXPECT_EQ(most_running.load(), 1u);

    // started_at of each job comes after finished_at of the one before it
    auto history = engine.history();
    ASSERT_EQ(history.size(), jobs);
    for (std::size_t i = 0; i < jobs; ++i) {
        EXPECT_EQ(history[i].id, ids[i]);
        EXPECT_EQ(history[i].status, transfer_status::completed);
        ASSERT_TRUE(history[i].started_at.has_value());
        ASSERT_TRUE(history[i].finished_at.has_value());
        if (i > 0) {
            EXPECT_GE(*history[i].started_at, *history[i - 1].finished_at);
        }
    }
}

TEST_F(TransferEngineTest, ShutdownRejectsNewJobs) {
    write_file(local_ / "a.txt", "x");
    auto& engine = make_engine();

    engine.shutdown();
    engine.shutdown();

    auto id = engine.enqueue(transfer_request::upload((local_ / "a.txt").string(), "/home/deck/a.txt"));
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, error_code::cancelled);
}

}  // namespace kcenon::deck_bridge::test
