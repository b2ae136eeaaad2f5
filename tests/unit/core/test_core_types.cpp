/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, error, result)
 */

#include <gtest/gtest.h>

#include <kcenon/vfs_transfer/core/types.h>

#include <set>
#include <string>

namespace kcenon::vfs_transfer::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // File errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::remove_failed), -108);

    // Contract errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::not_implemented), -120);
    EXPECT_EQ(static_cast<int>(error_code::unsupported_transfer), -122);

    // Construction errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::missing_dependencies), -140);
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -141);

    // Transfer errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::transfer_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::remote_command_failed), -162);

    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::file_not_found), "file not found");
    EXPECT_STREQ(to_string(error_code::action_not_supported), "action not supported");
    EXPECT_STREQ(to_string(error_code::missing_dependencies), "missing dependencies");
    EXPECT_STREQ(to_string(error_code::remote_command_failed), "remote command failed");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, RangePredicates) {
    EXPECT_TRUE(is_file_error(error_code::rename_failed));
    EXPECT_FALSE(is_file_error(error_code::not_implemented));

    EXPECT_TRUE(is_contract_error(error_code::action_not_supported));
    EXPECT_FALSE(is_contract_error(error_code::transfer_failed));

    EXPECT_TRUE(is_construction_error(error_code::missing_dependencies));
    EXPECT_FALSE(is_construction_error(error_code::file_not_found));

    EXPECT_TRUE(is_transfer_error(error_code::remote_command_failed));
    EXPECT_FALSE(is_transfer_error(error_code::internal_error));
}

TEST_F(ErrorCodeTest, AllNamedCodesHaveDistinctStrings) {
    std::set<std::string> names;
    for (auto code : {error_code::file_not_found, error_code::file_access_denied,
                      error_code::file_already_exists, error_code::invalid_file_path,
                      error_code::file_read_error, error_code::file_write_error,
                      error_code::directory_create_failed, error_code::rename_failed,
                      error_code::remove_failed, error_code::not_implemented,
                      error_code::action_not_supported, error_code::unsupported_transfer,
                      error_code::missing_dependencies, error_code::invalid_configuration,
                      error_code::transfer_failed,
                      error_code::remote_command_failed, error_code::checksum_failed,
                      error_code::internal_error}) {
        EXPECT_TRUE(names.insert(to_string(code)).second) << to_string(code);
    }
}

// =============================================================================
// error Tests
// =============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ErrorTest, CodeOnlyUsesCodeString) {
    error err(error_code::file_not_found);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "file not found");
    EXPECT_EQ(err.details_as<unsupported_action_details>(), nullptr);
}

TEST_F(ErrorTest, ActionNotSupportedMessage) {
    auto err = make_action_not_supported("reflink", "s3");

    EXPECT_EQ(err.code, error_code::action_not_supported);
    EXPECT_EQ(err.message, "reflink is not supported for s3 remotes");

    const auto* details = err.details_as<unsupported_action_details>();
    ASSERT_NE(details, nullptr);
    EXPECT_EQ(details->action, "reflink");
    EXPECT_EQ(details->scheme, "s3");
    EXPECT_EQ(err.details_as<command_failure_details>(), nullptr);
}

TEST_F(ErrorTest, NotImplementedNamesActionAndScheme) {
    auto err = make_not_implemented("checksum", "gdrive");

    EXPECT_EQ(err.code, error_code::not_implemented);
    EXPECT_NE(err.message.find("checksum"), std::string::npos);
    EXPECT_NE(err.message.find("gdrive"), std::string::npos);
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected(error{error_code::file_read_error, "short read"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_read_error);
    EXPECT_EQ(r.error().message, "short read");
}

TEST_F(ResultTest, MoveValueOut) {
    result<std::string> r = std::string("payload");
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST_F(ResultTest, VoidSuccessAndFailure) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::transfer_failed, "boom"});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::transfer_failed);
}

TEST_F(ResultTest, CopyPreservesDetails) {
    result<void> failed = unexpected(make_action_not_supported("walk", "http"));
    result<void> copy = failed;

    ASSERT_FALSE(copy.has_value());
    ASSERT_NE(copy.error().details_as<unsupported_action_details>(), nullptr);
    EXPECT_EQ(copy.error().details_as<unsupported_action_details>()->action, "walk");
}

}  // namespace kcenon::vfs_transfer::test
