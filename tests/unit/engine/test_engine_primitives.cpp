/**
 * @file test_engine_primitives.cpp
 * @brief Unit tests for result_channel and cancellation_token
 */

#include <gtest/gtest.h>

#include <kcenon/sftp_stress/engine/cancellation_token.h>
#include <kcenon/sftp_stress/engine/result_channel.h>

#include <chrono>
#include <memory>
#include <set>
#include <thread>
#include <vector>

namespace kcenon::sftp_stress::test {

using namespace std::chrono_literals;

// =============================================================================
// result_channel Tests
// =============================================================================

class ResultChannelTest : public ::testing::Test {
protected:
    result_channel<int> channel_;
};

TEST_F(ResultChannelTest, FifoOrder) {
    channel_.push(1);
    channel_.push(2);
    channel_.push(3);

    EXPECT_EQ(channel_.size(), 3u);
    EXPECT_EQ(channel_.pop(), 1);
    EXPECT_EQ(channel_.pop(), 2);
    EXPECT_EQ(channel_.pop(), 3);
}

TEST_F(ResultChannelTest, TryPopOnEmpty) {
    EXPECT_FALSE(channel_.try_pop().has_value());
}

TEST_F(ResultChannelTest, PopForTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto value = channel_.pop_for(50ms);

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST_F(ResultChannelTest, PopBlocksUntilPush) {
    std::thread producer([this] {
        std::this_thread::sleep_for(20ms);
        channel_.push(42);
    });

    EXPECT_EQ(channel_.pop(), 42);
    producer.join();
}

TEST_F(ResultChannelTest, MultipleProducersDeliverEverything) {
    constexpr int producers = 4;
    constexpr int per_producer = 250;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([this, p] {
            for (int i = 0; i < per_producer; ++i) {
                channel_.push(p * per_producer + i);
            }
        });
    }

    std::set<int> received;
    for (int i = 0; i < producers * per_producer; ++i) {
        received.insert(channel_.pop());
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(received.size(), static_cast<std::size_t>(producers * per_producer));
}

TEST(ResultChannelMoveOnlyTest, CarriesMoveOnlyValues) {
    result_channel<std::unique_ptr<int>> channel;
    channel.push(std::make_unique<int>(7));

    auto value = channel.pop();
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, 7);
}

// =============================================================================
// cancellation_token Tests
// =============================================================================

class CancellationTokenTest : public ::testing::Test {
protected:
    cancellation_token token_;
};

TEST_F(CancellationTokenTest, StartsUncancelled) {
    EXPECT_FALSE(token_.is_cancelled());
}

TEST_F(CancellationTokenTest, CancelAndReset) {
    token_.cancel();
    EXPECT_TRUE(token_.is_cancelled());

    token_.reset();
    EXPECT_FALSE(token_.is_cancelled());
}

TEST_F(CancellationTokenTest, WaitForTimesOutWhenNotCancelled) {
    auto start = std::chrono::steady_clock::now();

    EXPECT_FALSE(token_.wait_for(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST_F(CancellationTokenTest, WaitForWakesOnCancel) {
    std::thread canceller([this] {
        std::this_thread::sleep_for(20ms);
        token_.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token_.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

TEST_F(CancellationTokenTest, WaitForReturnsImmediatelyWhenCancelled) {
    token_.cancel();
    EXPECT_TRUE(token_.wait_for(5s));
}

}  // namespace kcenon::sftp_stress::test
