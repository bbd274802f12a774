/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/deck_bridge/deck_bridge.h>

namespace kcenon::deck_bridge::test {

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(VersionTest, MajorVersionIsCorrect) {
    EXPECT_EQ(version::major, 0);
}

TEST_F(VersionTest, MinorVersionIsCorrect) {
    EXPECT_EQ(version::minor, 1);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, VersionStringFormat) {
    auto ver = version::to_string();
    EXPECT_FALSE(ver.empty());
    EXPECT_NE(ver.find('.'), std::string::npos);
}

}  // namespace kcenon::deck_bridge::test
