/**
 * @file test_token_bucket_pacer.cpp
 * @brief Unit tests for token_bucket_pacer
 */

#include <gtest/gtest.h>

#include <hns_transfer/sender/token_bucket_pacer.h>

#include <chrono>
#include <thread>

namespace hns_transfer::test {

using namespace std::chrono_literals;

class TokenBucketPacerTest : public ::testing::Test {};

TEST_F(TokenBucketPacerTest, UnlimitedNeverWaits) {
    token_bucket_pacer pacer(0);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pacer.request(operation_context::background(), 1024 * 1024).has_value());
    }

    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(pacer.bytes_per_second(), 0u);
}

TEST_F(TokenBucketPacerTest, BurstWithinCapacity) {
    token_bucket_pacer pacer(1000);

    EXPECT_TRUE(pacer.try_request(600));
    EXPECT_TRUE(pacer.try_request(400));
    EXPECT_FALSE(pacer.try_request(500));
}

TEST_F(TokenBucketPacerTest, RequestWaitsForRefill) {
    token_bucket_pacer pacer(10000);
    ASSERT_TRUE(pacer.try_request(10000));

    auto start = std::chrono::steady_clock::now();
    auto granted = pacer.request(operation_context::background(), 1000);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(granted.has_value());
    EXPECT_GE(elapsed, 50ms);
}

TEST_F(TokenBucketPacerTest, CancelledContextStopsWaiting) {
    token_bucket_pacer pacer(100);
    ASSERT_TRUE(pacer.try_request(100));

    cancellation_source source;
    std::thread canceller([&source] {
        std::this_thread::sleep_for(50ms);
        source.cancel();
    });

    auto granted = pacer.request(source.context(), 100);
    canceller.join();

    ASSERT_FALSE(granted.has_value());
    EXPECT_EQ(granted.error().code, error_code::operation_cancelled);
}

TEST_F(TokenBucketPacerTest, DeadlineStopsWaiting) {
    token_bucket_pacer pacer(10);
    ASSERT_TRUE(pacer.try_request(10));

    auto granted = pacer.request(operation_context::background().with_timeout(30ms), 10);

    ASSERT_FALSE(granted.has_value());
    EXPECT_EQ(granted.error().code, error_code::deadline_exceeded);
}

TEST_F(TokenBucketPacerTest, SetLimitDisables) {
    token_bucket_pacer pacer(10);
    ASSERT_TRUE(pacer.try_request(10));

    pacer.set_limit(0);

    EXPECT_TRUE(pacer.request(operation_context::background(), 1'000'000).has_value());
    EXPECT_EQ(pacer.bytes_per_second(), 0u);
}

}  // namespace hns_transfer::test
