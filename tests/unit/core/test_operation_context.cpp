/**
 * @file test_operation_context.cpp
 * @brief Unit tests for operation_context and cancellation_source
 */

#include <gtest/gtest.h>

#include <hns_transfer/core/operation_context.h>

#include <thread>

namespace hns_transfer::test {

using namespace std::chrono_literals;

class OperationContextTest : public ::testing::Test {};

TEST_F(OperationContextTest, BackgroundIsNeverDone) {
    auto ctx = operation_context::background();

    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_FALSE(ctx.is_expired());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.remaining().has_value());
    EXPECT_TRUE(ctx.check().has_value());
}

TEST_F(OperationContextTest, CancelPropagatesToCopies) {
    cancellation_source source;
    auto ctx = source.context();
    auto copy = ctx;

    source.cancel();

    EXPECT_TRUE(source.is_cancelled());
    EXPECT_TRUE(ctx.is_cancelled());
    EXPECT_TRUE(copy.is_done());
    EXPECT_EQ(copy.check().error().code, error_code::operation_cancelled);
}

TEST_F(OperationContextTest, DerivedContextKeepsCancellation) {
    cancellation_source source;
    auto derived = source.context().with_timeout(1h);

    EXPECT_TRUE(derived.shares_cancellation_with(source.context()));

    source.cancel();

    EXPECT_TRUE(derived.is_cancelled());
}

TEST_F(OperationContextTest, BackgroundIgnoresOtherSources) {
    cancellation_source source;
    auto cleanup_ctx = operation_context::background().with_timeout(2min);

    source.cancel();

    EXPECT_FALSE(cleanup_ctx.is_cancelled());
    EXPECT_FALSE(cleanup_ctx.shares_cancellation_with(source.context()));
    EXPECT_TRUE(cleanup_ctx.check().has_value());
}

TEST_F(OperationContextTest, TimeoutSetsDeadline) {
    auto before = operation_context::clock::now();
    auto ctx = operation_context::background().with_timeout(2min);
    auto after = operation_context::clock::now();

    ASSERT_TRUE(ctx.deadline().has_value());
    EXPECT_GE(*ctx.deadline(), before + 2min);
    EXPECT_LE(*ctx.deadline(), after + 2min);

    auto left = ctx.remaining();
    ASSERT_TRUE(left.has_value());
    EXPECT_LE(*left, std::chrono::duration_cast<operation_context::clock::duration>(2min));
}

TEST_F(OperationContextTest, EarlierDeadlineWins) {
    auto outer = operation_context::background().with_timeout(1s);
    auto inner = outer.with_timeout(1h);

    EXPECT_EQ(inner.deadline(), outer.deadline());
}

TEST_F(OperationContextTest, ExpiredContextReportsDeadline) {
    auto ctx = operation_context::background().with_timeout(1ms);

    std::this_thread::sleep_for(5ms);

    EXPECT_TRUE(ctx.is_expired());
    EXPECT_EQ(ctx.remaining().value(), operation_context::clock::duration::zero());
    EXPECT_EQ(ctx.check().error().code, error_code::deadline_exceeded);
}

TEST_F(OperationContextTest, ContextOutlivesSource) {
    std::optional<operation_context> ctx;
    {
        cancellation_source source;
        ctx = source.context();
        source.cancel();
    }

    EXPECT_TRUE(ctx->is_cancelled());
}

TEST_F(OperationContextTest, MovedFromSourceIsInert) {
    cancellation_source source;
    auto ctx = source.context();
    cancellation_source moved(std::move(source));

    source.cancel();
    EXPECT_FALSE(ctx.is_cancelled());

    moved.cancel();
    EXPECT_TRUE(ctx.is_cancelled());
}

}  // namespace hns_transfer::test
