/**
 * @file test_statistics_collector.cpp
 * @brief Unit tests for sliding-window speed and ETA
 */

#include <gtest/gtest.h>

#include <kcenon/deck_bridge/core/statistics_collector.h>

#include <chrono>

namespace kcenon::deck_bridge::test {

using namespace std::chrono_literals;

class StatisticsCollectorTest : public ::testing::Test {
protected:
    time_point t0_ = std::chrono::steady_clock::now();
};

TEST_F(StatisticsCollectorTest, InitialState) {
    statistics_collector stats;

    EXPECT_FALSE(stats.is_active());
    EXPECT_EQ(stats.get_bytes_transferred(), 0u);
    EXPECT_DOUBLE_EQ(stats.get_transfer_rate(), 0.0);
    EXPECT_FALSE(stats.get_eta().has_value());
}

TEST_F(StatisticsCollectorTest, RateFromWindow) {
    statistics_collector stats(statistics_collector::config{3});
    stats.start(1000, 0, t0_);

    stats.record_chunk(100, t0_ + 100ms);
    stats.record_chunk(100, t0_ + 200ms);

    EXPECT_DOUBLE_EQ(stats.get_transfer_rate(), 1000.0);
    ASSERT_TRUE(stats.get_eta().has_value());
    EXPECT_EQ(*stats.get_eta(), 800ms);
    EXPECT_EQ(stats.get_chunks_transferred(), 2u);
}

TEST_F(StatisticsCollectorTest, WindowDropsOldSamples) {
    statistics_collector stats(statistics_collector::config{3});
    stats.start(1000, 0, t0_);

    stats.record_chunk(100, t0_ + 100ms);
    stats.record_chunk(100, t0_ + 200ms);
    stats.record_chunk(100, t0_ + 300ms);
    stats.record_chunk(300, t0_ + 400ms);

    // Window now spans 200ms..400ms: 400 bytes in 0.2s
    EXPECT_DOUBLE_EQ(stats.get_transfer_rate(), 2000.0);
    EXPECT_EQ(*stats.get_eta(), 200ms);
}

TEST_F(StatisticsCollectorTest, ResumeOffsetExcludedFromAverage) {
    statistics_collector stats;
    stats.start(1000, 600, t0_);
    stats.record_chunk(100, t0_ + 100ms);

    EXPECT_EQ(stats.get_bytes_transferred(), 700u);
    EXPECT_DOUBLE_EQ(stats.get_average_rate(), 1000.0);
    ASSERT_TRUE(stats.get_completion_percentage().has_value());
    EXPECT_DOUBLE_EQ(*stats.get_completion_percentage(), 70.0);
}

TEST_F(StatisticsCollectorTest, EtaIndeterminate) {
    statistics_collector unknown_total;
    unknown_total.start(std::nullopt, 0, t0_);
    unknown_total.record_chunk(100, t0_ + 100ms);
    EXPECT_FALSE(unknown_total.get_eta().has_value());
    EXPECT_FALSE(unknown_total.get_completion_percentage().has_value());

    statistics_collector no_samples;
    no_samples.start(1000, 0, t0_);
    EXPECT_FALSE(no_samples.get_eta().has_value());
}

TEST_F(StatisticsCollectorTest, EtaZeroWhenDone) {
    statistics_collector stats;
    stats.start(200, 0, t0_);
    stats.record_chunk(200, t0_ + 50ms);

    EXPECT_EQ(*stats.get_eta(), 0ms);
}

TEST_F(StatisticsCollectorTest, SnapshotAndReset) {
    statistics_collector stats;
    stats.start(400, 0, t0_);
    stats.record_chunk(100, t0_ + 100ms);

    auto snap = stats.get_snapshot();
    EXPECT_EQ(snap.bytes_transferred, 100u);
    EXPECT_EQ(snap.total_bytes, 400u);
    EXPECT_EQ(snap.elapsed, 100ms);
    EXPECT_TRUE(stats.is_active());

    stats.stop();
    EXPECT_FALSE(stats.is_active());

    stats.reset();
    EXPECT_EQ(stats.get_bytes_transferred(), 0u);
    EXPECT_FALSE(stats.get_snapshot().total_bytes.has_value());
}

}  // namespace kcenon::deck_bridge::test
