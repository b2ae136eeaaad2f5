/**
 * @file test_path_info.cpp
 * @brief Unit tests for path_info and temporary_sibling
 */

#include <gtest/gtest.h>

#include <kcenon/vfs_transfer/fs/path_info.h>

#include <cctype>
#include <set>
#include <sstream>

namespace kcenon::vfs_transfer::test {

class PathInfoTest : public ::testing::Test {};

TEST_F(PathInfoTest, NormalizesSeparators) {
    path_info p("s3", "bucket//data/");

    EXPECT_EQ(p.scheme(), "s3");
    EXPECT_EQ(p.path(), "bucket/data");
    EXPECT_EQ(path_info("local", "C:\\data\\file.txt").path(), "C:/data/file.txt");
    EXPECT_EQ(path_info("local", "/").path(), "/");
}

TEST_F(PathInfoTest, EqualityIsSchemeAndPath) {
    EXPECT_EQ(path_info("s3", "bucket/a"), path_info("s3", "bucket//a/"));
    EXPECT_NE(path_info("s3", "bucket/a"), path_info("gs", "bucket/a"));
    EXPECT_NE(path_info("s3", "bucket/a"), path_info("s3", "bucket/b"));
    EXPECT_LT(path_info("s3", "bucket/a"), path_info("s3", "bucket/b"));
}

TEST_F(PathInfoTest, NameAndParent) {
    path_info p("s3", "bucket/data/images/cat.png");

    EXPECT_EQ(p.name(), "cat.png");
    EXPECT_EQ(p.parent(), path_info("s3", "bucket/data/images"));
    EXPECT_EQ(path_info("local", "/a").parent(), path_info("local", "/"));
    EXPECT_EQ(path_info("local", "/").name(), "");
}

TEST_F(PathInfoTest, JoinRelativePath) {
    auto root = path_info("s3", "bucket/data");

    EXPECT_EQ(root / "images/cat.png", path_info("s3", "bucket/data/images/cat.png"));
    EXPECT_EQ(root / "/x", path_info("s3", "bucket/data/x"));
    EXPECT_EQ(root / "", root);
    EXPECT_EQ(path_info("local", "/") / "tmp", path_info("local", "/tmp"));
}

TEST_F(PathInfoTest, RelativeTo) {
    auto root = path_info("mem", "/a");

    auto relative = path_info("mem", "/a/y/z").relative_to(root);
    ASSERT_TRUE(relative.has_value());
    EXPECT_EQ(relative.value(), "y/z");

    EXPECT_EQ(path_info("local", "/tmp/x").relative_to(path_info("local", "/")).value(),
              "tmp/x");
}

TEST_F(PathInfoTest, RelativeToRejectsNonAncestors) {
    auto root = path_info("mem", "/a");

    auto sibling = path_info("mem", "/ab/c").relative_to(root);
    ASSERT_FALSE(sibling.has_value());
    EXPECT_EQ(sibling.error().code, error_code::invalid_file_path);

    EXPECT_FALSE(root.relative_to(root).has_value());
    EXPECT_FALSE(path_info("s3", "/a/b").relative_to(root).has_value());
}

TEST_F(PathInfoTest, IsUnder) {
    auto root = path_info("mem", "/a");

    EXPECT_TRUE(path_info("mem", "/a/b").is_under(root));
    EXPECT_FALSE(path_info("mem", "/a").is_under(root));
    EXPECT_FALSE(path_info("mem", "/abc").is_under(root));
}

TEST_F(PathInfoTest, UrlFormatting) {
    EXPECT_EQ(path_info("s3", "bucket/key").url(), "s3://bucket/key");
    EXPECT_EQ(path_info::local("/tmp/file").url(), "/tmp/file");

    std::ostringstream oss;
    oss << path_info("gs", "bucket/x");
    EXPECT_EQ(oss.str(), "gs://bucket/x");
}

TEST_F(PathInfoTest, FromUrl) {
    auto remote = path_info::from_url("ssh://host/srv/data");
    EXPECT_EQ(remote.scheme(), "ssh");
    EXPECT_EQ(remote.path(), "host/srv/data");

    auto local = path_info::from_url("/var/tmp/x");
    EXPECT_TRUE(local.is_local());
    EXPECT_EQ(local.path(), "/var/tmp/x");
}

// =============================================================================
// temporary_sibling Tests
// =============================================================================

TEST(TemporarySiblingTest, ColocatedWithTarget) {
    auto target = path_info::local("/data/out/report.csv");

    auto tmp = temporary_sibling(target);

    EXPECT_EQ(tmp.parent(), target.parent());
    auto name = tmp.name();
    // "report.csv." + 16 hex + ".tmp"
    ASSERT_EQ(name.size(), std::string("report.csv.").size() + 16 + 4);
    EXPECT_EQ(name.rfind("report.csv.", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 4), ".tmp");
    for (char c : name.substr(11, 16)) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << name;
    }
}

TEST(TemporarySiblingTest, NamesAreUnique) {
    auto target = path_info::local("/data/file");
    std::set<std::string> names;
    for (int i = 0; i < 100; ++i) {
        names.insert(temporary_sibling(target).name());
    }
    EXPECT_EQ(names.size(), 100u);
}

}  // namespace kcenon::vfs_transfer::test
