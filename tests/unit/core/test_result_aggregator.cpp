/**
 * @file test_result_aggregator.cpp
 * @brief Unit tests for outcome aggregation and run summaries
 */

#include <gtest/gtest.h>

#include <kcenon/sftp_stress/core/result_aggregator.h>

#include <string>
#include <thread>
#include <vector>

namespace kcenon::sftp_stress::test {

namespace {

auto make_outcome(std::string name, bool success, double connect, double transfer,
                  uint64_t payload = 1000, uint64_t archive = 1020) -> transfer_outcome {
    transfer_outcome o;
    o.name = std::move(name);
    o.success = success;
    o.connect_time = seconds_f{connect};
    o.transfer_time = seconds_f{transfer};
    o.payload_size = payload;
    o.archive_size = archive;
    if (!success) {
        o.code = error_code::connection_failed;
        o.error_message = "connection refused";
    }
    return o;
}

}  // namespace

// =============================================================================
// Natural Ordering Tests
// =============================================================================

TEST(NaturalNameLessTest, NumbersCompareByValue) {
    EXPECT_TRUE(natural_name_less("test_2.lz4", "test_10.lz4"));
    EXPECT_FALSE(natural_name_less("test_10.lz4", "test_2.lz4"));
    EXPECT_TRUE(natural_name_less("test_9.lz4", "test_11.lz4"));
}

TEST(NaturalNameLessTest, EqualNamesAreNotLess) {
    EXPECT_FALSE(natural_name_less("test_3.lz4", "test_3.lz4"));
}

TEST(NaturalNameLessTest, TextComparedLexically) {
    EXPECT_TRUE(natural_name_less("alpha", "beta"));
    EXPECT_TRUE(natural_name_less("test", "test_0.lz4"));
}

TEST(NaturalNameLessTest, LeadingZerosBreakTies) {
    EXPECT_TRUE(natural_name_less("test_1", "test_01"));
    EXPECT_FALSE(natural_name_less("test_01", "test_1"));
}

// =============================================================================
// summarize Tests
// =============================================================================

class SummarizeTest : public ::testing::Test {};

TEST_F(SummarizeTest, EmptyRun) {
    auto s = summarize({}, seconds_f{1.0});

    EXPECT_EQ(s.total, 0u);
    EXPECT_EQ(s.succeeded, 0u);
    EXPECT_DOUBLE_EQ(s.mean_transfer_time.count(), 0.0);
    EXPECT_DOUBLE_EQ(s.throughput_bytes_per_second, 0.0);
}

TEST_F(SummarizeTest, TimingStatsCoverSuccessesOnly) {
    std::vector<transfer_outcome> outcomes = {
        make_outcome("test_0.lz4", true, 0.1, 1.0),
        make_outcome("test_1.lz4", true, 0.3, 3.0),
        make_outcome("test_2.lz4", false, 20.0, 0.0),
    };

    auto s = summarize(outcomes, seconds_f{2.0});

    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.succeeded, 2u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_NEAR(s.mean_connect_time.count(), 0.2, 1e-9);
    EXPECT_NEAR(s.max_connect_time.count(), 0.3, 1e-9);
    EXPECT_NEAR(s.min_transfer_time.count(), 1.0, 1e-9);
    EXPECT_NEAR(s.max_transfer_time.count(), 3.0, 1e-9);
}

TEST_F(SummarizeTest, ByteTotals) {
    std::vector<transfer_outcome> outcomes = {
        make_outcome("test_0.lz4", true, 0.0, 1.0, 1000, 1100),
        make_outcome("test_1.lz4", false, 0.0, 0.0, 2000, 2100),
    };

    auto s = summarize(outcomes, seconds_f{2.0});

    EXPECT_EQ(s.total_payload_bytes, 3000u);
    EXPECT_EQ(s.total_archive_bytes, 1100u);
    EXPECT_DOUBLE_EQ(s.throughput_bytes_per_second, 550.0);
}

// =============================================================================
// result_aggregator Tests
// =============================================================================

class ResultAggregatorTest : public ::testing::Test {
protected:
    result_aggregator aggregator_;
};

TEST_F(ResultAggregatorTest, RecordReturnsRunningCount) {
    EXPECT_EQ(aggregator_.record(make_outcome("test_0.lz4", true, 0, 0)), 1u);
    EXPECT_EQ(aggregator_.record(make_outcome("test_1.lz4", true, 0, 0)), 2u);
    EXPECT_EQ(aggregator_.count(), 2u);
}

TEST_F(ResultAggregatorTest, FinalizeMovesOutcomesOut) {
    aggregator_.record(make_outcome("test_0.lz4", true, 0, 0));
    aggregator_.record(make_outcome("test_1.lz4", false, 0, 0));

    auto report = aggregator_.finalize(seconds_f{1.0});

    EXPECT_EQ(report.size(), 2u);
    EXPECT_FALSE(report.all_succeeded());
    EXPECT_EQ(report.summary().failed, 1u);
    EXPECT_EQ(aggregator_.count(), 0u);
}

TEST_F(ResultAggregatorTest, SortedByNameUsesNaturalOrder) {
    aggregator_.record(make_outcome("test_10.lz4", true, 0, 0));
    aggregator_.record(make_outcome("test_2.lz4", true, 0, 0));
    aggregator_.record(make_outcome("test_0.lz4", true, 0, 0));

    auto report = aggregator_.finalize(seconds_f{0.0});
    auto sorted = report.sorted_by_name();

    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].name, "test_0.lz4");
    EXPECT_EQ(sorted[1].name, "test_2.lz4");
    EXPECT_EQ(sorted[2].name, "test_10.lz4");

    // Completion order is preserved in outcomes()
    EXPECT_EQ(report.outcomes()[0].name, "test_10.lz4");
}

TEST_F(ResultAggregatorTest, ConcurrentRecording) {
    constexpr int threads = 8;
    constexpr int per_thread = 100;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, t] {
            for (int i = 0; i < per_thread; ++i) {
                aggregator_.record(make_outcome(
                    "test_" + std::to_string(t * per_thread + i) + ".lz4", true, 0, 0));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(aggregator_.count(), static_cast<std::size_t>(threads * per_thread));
    EXPECT_EQ(aggregator_.summary().succeeded, static_cast<std::size_t>(threads * per_thread));
}

TEST_F(ResultAggregatorTest, ClearDiscardsOutcomes) {
    aggregator_.record(make_outcome("test_0.lz4", true, 0, 0));
    aggregator_.clear();

    EXPECT_EQ(aggregator_.count(), 0u);
    EXPECT_TRUE(aggregator_.snapshot().empty());
}

}  // namespace kcenon::sftp_stress::test
