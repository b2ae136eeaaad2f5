/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/vfs_transfer/vfs_transfer.h>

namespace kcenon::vfs_transfer::test {

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, VersionNumbers) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

}  // namespace kcenon::vfs_transfer::test
