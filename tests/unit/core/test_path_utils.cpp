/**
 * @file test_path_utils.cpp
 * @brief Unit tests for remote path validation and display helpers
 */

#include <gtest/gtest.h>

#include <kcenon/deck_bridge/core/path_utils.h>

#include <string>
#include <utility>
#include <vector>

namespace kcenon::deck_bridge::test {

class PathValidationTest : public ::testing::Test {};

TEST_F(PathValidationTest, AcceptsOrdinaryPaths) {
    EXPECT_TRUE(validate_remote_path("/home/deck/roms/game.iso"));
    EXPECT_TRUE(validate_remote_path("/"));
    EXPECT_TRUE(validate_remote_path("/home/deck/..hidden"));
    EXPECT_TRUE(validate_remote_path("/home/deck/file..bak"));
    EXPECT_TRUE(validate_remote_path("/home/deck/./roms"));
}

TEST_F(PathValidationTest, RejectsRelativePaths) {
    auto r = validate_remote_path("foo/bar");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::path_traversal_rejected);

    EXPECT_FALSE(validate_remote_path("./local"));
    EXPECT_FALSE(validate_remote_path("save.dat"));
}

TEST_F(PathValidationTest, RejectsParentSegments) {
    auto r = validate_remote_path("../../etc/passwd");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::path_traversal_rejected);

    EXPECT_FALSE(validate_remote_path("/home/deck/../../etc"));
    EXPECT_FALSE(validate_remote_path("/home/deck/.."));
    EXPECT_FALSE(validate_remote_path(".."));
}

TEST_F(PathValidationTest, RejectsEmptyAndNul) {
    auto empty = validate_remote_path("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, error_code::path_traversal_rejected);

    std::string with_nul("/home/deck/a");
    with_nul.push_back('\0');
    with_nul += "b";
    auto nul = validate_remote_path(with_nul);
    ASSERT_FALSE(nul);
    EXPECT_EQ(nul.error().code, error_code::path_traversal_rejected);
}

class PosixPathTest : public ::testing::Test {};

TEST_F(PosixPathTest, Join) {
    EXPECT_EQ(posix_join("/home/deck", "roms"), "/home/deck/roms");
    EXPECT_EQ(posix_join("/home/deck/", "roms"), "/home/deck/roms");
    EXPECT_EQ(posix_join("/", "home"), "/home");
    EXPECT_EQ(posix_join("", "roms"), "roms");
    EXPECT_EQ(posix_join("/home/deck", "/etc"), "/etc");
    EXPECT_EQ(posix_join("/home/deck", ""), "/home/deck");
}

TEST_F(PosixPathTest, BasenameAndParent) {
    EXPECT_EQ(posix_basename("/home/deck/game.iso"), "game.iso");
    EXPECT_EQ(posix_basename("/home/deck/roms/"), "roms");
    EXPECT_EQ(posix_basename("/"), "");
    EXPECT_EQ(posix_basename("file"), "file");

    EXPECT_EQ(posix_parent("/home/deck/game.iso"), "/home/deck");
    EXPECT_EQ(posix_parent("/home"), "/");
    EXPECT_EQ(posix_parent("file"), "");
}

TEST_F(PosixPathTest, TempPath) {
    EXPECT_EQ(temp_path_for("/home/deck/game.iso"), "/home/deck/game.iso.tmp");
    EXPECT_EQ(temp_suffix, ".tmp");
}

class DisplayHelpersTest : public ::testing::Test {};

TEST_F(DisplayHelpersTest, HumanReadableSize) {
    EXPECT_EQ(human_readable_size(0), "0 B");
    EXPECT_EQ(human_readable_size(512), "512 B");
    EXPECT_EQ(human_readable_size(1023), "1023 B");
    EXPECT_EQ(human_readable_size(1536), "1.5 KB");
    EXPECT_EQ(human_readable_size(1048576), "1.0 MB");
    EXPECT_EQ(human_readable_size(int64_t{10} * 1024 * 1024 * 1024), "10.0 GB");
    EXPECT_EQ(human_readable_size(-5), "0 B");
}

TEST_F(DisplayHelpersTest, AbsoluteSegments) {
    using segments = std::vector<std::pair<std::string, std::string>>;

    segments expected{{"/", "/"},
                      {"home", "/home"},
                      {"deck", "/home/deck"},
                      {"roms", "/home/deck/roms"}};
    EXPECT_EQ(remote_path_segments("/home/deck/roms"), expected);
    EXPECT_EQ(remote_path_segments("/home/deck/roms/"), expected);
}

TEST_F(DisplayHelpersTest, RelativeAndRootSegments) {
    using segments = std::vector<std::pair<std::string, std::string>>;

    EXPECT_EQ(remote_path_segments("a/b"), (segments{{"a", "a"}, {"b", "a/b"}}));
    EXPECT_EQ(remote_path_segments("/"), (segments{{"/", "/"}}));
    EXPECT_TRUE(remote_path_segments("").empty());
}

}  // namespace kcenon::deck_bridge::test
