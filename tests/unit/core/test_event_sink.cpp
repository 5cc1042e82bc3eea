/**
 * @file test_event_sink.cpp
 * @brief Unit tests for event sinks
 */

#include <gtest/gtest.h>

#include <kcenon/sftp_stress/core/event_sink.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::sftp_stress::test {

class LoggingEventSinkTest : public ::testing::Test {
protected:
    struct captured {
        log_level level;
        std::string category;
        std::string message;
        std::optional<std::string> error;
    };

    void SetUp() override {
        logger_ = std::make_shared<stress_logger>();
        logger_->set_level(log_level::trace);
        logger_->set_callback([this](log_level level, std::string_view category,
                                     std::string_view message, const run_log_context* ctx) {
            captured entry{level, std::string(category), std::string(message), std::nullopt};
            if (ctx) {
                entry.error = ctx->error_message;
            }
            entries_.push_back(std::move(entry));
        });
        sink_ = std::make_shared<logging_event_sink>(logger_, "10.0.0.7");
    }

    auto count_containing(std::string_view text) const -> std::size_t {
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.message.find(text) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    std::shared_ptr<stress_logger> logger_;
    std::shared_ptr<logging_event_sink> sink_;
    std::vector<captured> entries_;
};

TEST_F(LoggingEventSinkTest, SuccessfulTransferLoggedAtInfo) {
    transfer_outcome outcome;
    outcome.name = "test_0.lz4";
    outcome.success = true;

    sink_->on_transfer_completed(outcome, 1, 3);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, log_level::info);
    EXPECT_EQ(entries_[0].category, "sftp_stress.scheduler");
    EXPECT_NE(entries_[0].message.find("[1/3]"), std::string::npos);
}

TEST_F(LoggingEventSinkTest, FailedTransferLoggedAtErrorWithMessage) {
    transfer_outcome outcome;
    outcome.name = "test_1.lz4";
    outcome.success = false;
    outcome.code = error_code::authentication_failed;
    outcome.error_message = "authentication rejected";

    sink_->on_transfer_completed(outcome, 2, 3);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, log_level::error);
    EXPECT_EQ(entries_[0].error, "authentication rejected");
}

TEST_F(LoggingEventSinkTest, FailureWithoutMessageUsesCodeText) {
    transfer_outcome outcome;
    outcome.name = "test_2.lz4";
    outcome.code = error_code::connection_timeout;

    sink_->on_transfer_completed(outcome, 3, 3);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].error, "connection timeout");
}

TEST_F(LoggingEventSinkTest, ProgressLoggedOnQuarterMilestones) {
    sink_->on_transfer_progress("test_0.lz4", 100, 400);
    sink_->on_transfer_progress("test_0.lz4", 120, 400);
    sink_->on_transfer_progress("test_0.lz4", 250, 400);
    sink_->on_transfer_progress("test_0.lz4", 400, 400);

    EXPECT_EQ(count_containing("upload 25%"), 1u);
    EXPECT_EQ(count_containing("upload 50%"), 1u);
    EXPECT_EQ(count_containing("upload 100%"), 1u);
    EXPECT_EQ(entries_.size(), 3u);
}

TEST_F(LoggingEventSinkTest, FailedUploadReleasesProgressState) {
    sink_->on_transfer_progress("test_3.lz4", 100, 400);
    sink_->on_transfer_progress("test_3.lz4", 200, 400);
    EXPECT_EQ(sink_->tracked_uploads(), 1u);

    transfer_outcome outcome;
    outcome.name = "test_3.lz4";
    outcome.success = false;
    outcome.code = error_code::remote_write_failed;
    sink_->on_transfer_completed(outcome, 1, 1);

    EXPECT_EQ(sink_->tracked_uploads(), 0u);
}

TEST_F(LoggingEventSinkTest, ReusedNameReportsMilestonesAgain) {
    sink_->on_transfer_progress("test_0.lz4", 200, 400);
    transfer_outcome outcome;
    outcome.name = "test_0.lz4";
    outcome.success = false;
    outcome.code = error_code::transfer_timeout;
    sink_->on_transfer_completed(outcome, 1, 1);

    // Next run with the same artifact name
    sink_->on_transfer_progress("test_0.lz4", 100, 400);

    EXPECT_EQ(count_containing("upload 25%"), 1u);
    EXPECT_EQ(count_containing("upload 50%"), 1u);
}

TEST_F(LoggingEventSinkTest, ProgressSilentAboveDebug) {
    logger_->set_level(log_level::info);

    sink_->on_transfer_progress("test_0.lz4", 400, 400);

    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingEventSinkTest, RunFinishedWarnsOnFailures) {
    run_summary summary;
    summary.total = 2;
    summary.succeeded = 1;
    summary.failed = 1;

    sink_->on_run_finished(summary);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, log_level::warn);
    EXPECT_NE(entries_[0].message.find("1/2 succeeded"), std::string::npos);
}

TEST_F(LoggingEventSinkTest, StateChangesLoggedAtDebug) {
    sink_->on_state_changed(run_state::idle, run_state::generating_payloads);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, log_level::debug);
    EXPECT_NE(entries_[0].message.find("idle -> generating_payloads"), std::string::npos);
}

TEST(NullEventSinkTest, DiscardsEverything) {
    null_event_sink null_sink;
    event_sink& sink = null_sink;
    transfer_outcome outcome;

    sink.log(log_level::fatal, log_category::session, "ignored");
    sink.on_transfer_progress("test_0.lz4", 1, 2);
    sink.on_transfer_completed(outcome, 1, 1);
    sink.on_run_finished(run_summary{});
    SUCCEED();
}

}  // namespace kcenon::sftp_stress::test
