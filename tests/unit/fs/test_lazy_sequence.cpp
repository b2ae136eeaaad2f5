/**
 * @file test_lazy_sequence.cpp
 * @brief Unit tests for lazy_sequence and files_of
 */

#include <gtest/gtest.h>

#include <kcenon/vfs_transfer/fs/lazy_sequence.h>

#include <memory>

namespace kcenon::vfs_transfer::test {

class LazySequenceTest : public ::testing::Test {};

TEST_F(LazySequenceTest, EmptySequence) {
    auto seq = lazy_sequence<int>::empty();

    EXPECT_TRUE(seq.is_empty().value());
    EXPECT_EQ(seq.count().value(), 0u);
    EXPECT_TRUE(seq.collect().value().empty());
}

TEST_F(LazySequenceTest, EachOpenStartsOver) {
    auto seq = lazy_sequence<int>::from_vector({1, 2, 3});

    auto first = seq.open();
    EXPECT_EQ(first->next().value(), 1);
    EXPECT_EQ(first->next().value(), 2);

    auto second = seq.open();
    EXPECT_EQ(second->next().value(), 1);

    EXPECT_FALSE(seq.is_empty().value());
    EXPECT_EQ(seq.count().value(), 3u);
    EXPECT_EQ(seq.collect().value(), (std::vector<int>{1, 2, 3}));
}

TEST_F(LazySequenceTest, ItemsAreProducedOnDemand) {
    auto produced = std::make_shared<int>(0);
    lazy_sequence<int> seq([produced]() {
        auto next = std::make_shared<int>(0);
        return std::make_unique<function_cursor<int>>(
            [produced, next]() -> result<std::optional<int>> {
                if (*next == 1000) {
                    return std::optional<int>{};
                }
                ++*produced;
                return std::optional<int>((*next)++);
            });
    });

    EXPECT_FALSE(seq.is_empty().value());
    EXPECT_EQ(*produced, 1);
}

TEST_F(LazySequenceTest, CursorStaysDoneAfterEnd) {
    auto seq = lazy_sequence<int>::from_vector({7});
    auto cursor = seq.open();

    EXPECT_EQ(cursor->next().value(), 7);
    EXPECT_FALSE(cursor->next().value().has_value());
    EXPECT_FALSE(cursor->next().value().has_value());
}

TEST_F(LazySequenceTest, ErrorsPropagate) {
    lazy_sequence<int> seq([]() {
        auto calls = std::make_shared<int>(0);
        return std::make_unique<function_cursor<int>>(
            [calls]() -> result<std::optional<int>> {
                if ((*calls)++ == 0) {
                    return std::optional<int>(1);
                }
                return unexpected(error{error_code::file_read_error, "listing failed"});
            });
    });

    EXPECT_FALSE(seq.is_empty().value());

    auto counted = seq.count();
    ASSERT_FALSE(counted.has_value());
    EXPECT_EQ(counted.error().code, error_code::file_read_error);

    EXPECT_FALSE(seq.collect().has_value());
}

TEST_F(LazySequenceTest, DefaultConstructedIsEmpty) {
    lazy_sequence<std::string> seq;
    EXPECT_TRUE(seq.is_empty().value());
}

// =============================================================================
// files_of Tests
// =============================================================================

TEST(FilesOfTest, FlattensWalkEntries) {
    auto root = path_info("mem", "/a");
    auto walk = lazy_sequence<walk_entry>::from_vector({
        walk_entry{root, {"empty", "y"}, {"x"}},
        walk_entry{root / "empty", {}, {}},
        walk_entry{root / "y", {}, {"z", "w"}},
    });

    auto files = files_of(walk).collect();

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value(),
              (std::vector<path_info>{root / "x", root / "y/z", root / "y/w"}));
}

TEST(FilesOfTest, EmptyDirectoriesOnlyGiveEmptySequence) {
    auto walk = lazy_sequence<walk_entry>::from_vector({
        walk_entry{path_info("mem", "/a"), {"b"}, {}},
        walk_entry{path_info("mem", "/a/b"), {}, {}},
    });

    EXPECT_TRUE(files_of(walk).is_empty().value());
}

}  // namespace kcenon::vfs_transfer::test
