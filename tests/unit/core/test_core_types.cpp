/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error_codes, result, run_types)
 */

#include <gtest/gtest.h>

#include <kcenon/sftp_stress/core/error_codes.h>
#include <kcenon/sftp_stress/core/run_types.h>
#include <kcenon/sftp_stress/core/types.h>

#include <string>
#include <unordered_set>

namespace kcenon::sftp_stress::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Connection errors: -700 to -709
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -700);
    EXPECT_EQ(static_cast<int>(error_code::session_not_open), -706);

    // Transfer errors: -710 to -729
    EXPECT_EQ(static_cast<int>(error_code::remote_open_failed), -710);
    EXPECT_EQ(static_cast<int>(error_code::transfer_cancelled), -715);

    // Setup errors: -750 to -759
    EXPECT_EQ(static_cast<int>(error_code::scratch_directory_failed), -750);
    EXPECT_EQ(static_cast<int>(error_code::compression_failed), -752);

    // Key validation errors: -760 to -769
    EXPECT_EQ(static_cast<int>(error_code::key_not_found), -760);

    // Run lifecycle errors: -770 to -779
    EXPECT_EQ(static_cast<int>(error_code::run_in_progress), -770);

    // Report errors: -780 to -789
    EXPECT_EQ(static_cast<int>(error_code::report_write_failed), -780);

    // Configuration errors: -790 to -799
    EXPECT_EQ(static_cast<int>(error_code::config_invalid), -790);
    EXPECT_EQ(static_cast<int>(error_code::config_type_mismatch), -794);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(error_code::success), "success");
    EXPECT_EQ(to_string(error_code::connection_timeout), "connection timeout");
    EXPECT_EQ(to_string(error_code::remote_delete_failed), "remote delete failed");
    EXPECT_EQ(to_string(error_code::config_unknown_key), "unknown configuration key");
    EXPECT_EQ(to_string(static_cast<error_code>(-1)), "unknown error");
}

TEST_F(ErrorCodeTest, ToStringIsDistinct) {
    const error_code codes[] = {
        error_code::connection_failed,    error_code::connection_timeout,
        error_code::host_resolution_failed, error_code::handshake_failed,
        error_code::authentication_failed, error_code::sftp_init_failed,
        error_code::session_not_open,     error_code::remote_open_failed,
        error_code::remote_write_failed,  error_code::remote_delete_failed,
        error_code::local_read_failed,    error_code::transfer_timeout,
        error_code::transfer_cancelled,   error_code::scratch_directory_failed,
        error_code::payload_write_failed, error_code::compression_failed,
        error_code::key_not_found,        error_code::key_passphrase_required,
        error_code::key_unreadable,       error_code::run_in_progress,
        error_code::internal_error,       error_code::report_write_failed,
        error_code::config_invalid,       error_code::config_file_error,
        error_code::config_parse_error,   error_code::config_unknown_key,
        error_code::config_type_mismatch,
    };

    std::unordered_set<std::string> seen;
    for (auto code : codes) {
        auto text = std::string(to_string(code));
        EXPECT_NE(text, "unknown error") << static_cast<int>(code);
        EXPECT_TRUE(seen.insert(text).second) << text;
    }
}

TEST_F(ErrorCodeTest, CategoryPredicates) {
    EXPECT_TRUE(is_connection_error(error_code::authentication_failed));
    EXPECT_FALSE(is_connection_error(error_code::remote_write_failed));

    EXPECT_TRUE(is_transfer_error(error_code::transfer_timeout));
    EXPECT_FALSE(is_transfer_error(error_code::connection_timeout));

    EXPECT_TRUE(is_setup_error(error_code::payload_write_failed));
    EXPECT_FALSE(is_setup_error(error_code::config_invalid));

    EXPECT_TRUE(is_validation_error(error_code::key_passphrase_required));
    EXPECT_TRUE(is_config_error(error_code::config_parse_error));
    EXPECT_FALSE(is_config_error(error_code::success));
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ValueResult) {
    result<int> r = 42;

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
    EXPECT_FALSE(r.error());
}

TEST_F(ResultTest, ErrorResult) {
    result<int> r = unexpected(error(error_code::key_not_found, "missing"));

    EXPECT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::key_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(ResultTest, ErrorWithDefaultMessage) {
    error err(error_code::run_in_progress);

    EXPECT_TRUE(err);
    EXPECT_EQ(err.message, "a run is already in progress");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    result<void> failed = unexpected(error(error_code::config_invalid));

    EXPECT_TRUE(ok);
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::config_invalid);
}

TEST_F(ResultTest, MoveOutValue) {
    result<std::string> r = std::string("payload");
    std::string moved = std::move(r).value();

    EXPECT_EQ(moved, "payload");
}

// =============================================================================
// run_state Tests
// =============================================================================

TEST(RunStateTest, ToString) {
    EXPECT_EQ(to_string(run_state::idle), "idle");
    EXPECT_EQ(to_string(run_state::generating_payloads), "generating_payloads");
    EXPECT_EQ(to_string(run_state::transferring), "transferring");
    EXPECT_EQ(to_string(run_state::aggregated), "aggregated");
    EXPECT_EQ(to_string(run_state::done), "done");
}

TEST(TransferOutcomeTest, Defaults) {
    transfer_outcome outcome;

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.code, error_code::success);
    EXPECT_FALSE(outcome.error_message.has_value());
    EXPECT_DOUBLE_EQ(outcome.connect_time.count(), 0.0);
}

}  // namespace kcenon::sftp_stress::test
