/**
 * @file test_chunk_plan.cpp
 * @brief Unit tests for chunk planning
 */

#include <gtest/gtest.h>

#include <hns_transfer/core/chunk_plan.h>

#include <limits>

namespace hns_transfer::test {

namespace {
constexpr uint32_t MiB = 1024 * 1024;
}  // namespace

class ChunkPlanTest : public ::testing::Test {};

TEST_F(ChunkPlanTest, PartialLastChunk) {
    auto plan = plan_chunks(10 * MiB, 4 * MiB);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().chunk_size, 4 * MiB);
    EXPECT_EQ(plan.value().num_chunks, 3u);
}

TEST_F(ChunkPlanTest, ExactMultipleHasNoTrailingChunk) {
    auto plan = plan_chunks(8 * MiB, 4 * MiB);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().num_chunks, 2u);
}

TEST_F(ChunkPlanTest, EmptySourceHasNoChunks) {
    auto plan = plan_chunks(0, 4 * MiB);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().chunk_size, 4 * MiB);
    EXPECT_EQ(plan.value().num_chunks, 0u);
}

TEST_F(ChunkPlanTest, SourceSmallerThanBlock) {
    auto plan = plan_chunks(1, 4 * MiB);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().num_chunks, 1u);
}

TEST_F(ChunkPlanTest, ZeroBlockSizeRejected) {
    auto plan = plan_chunks(1024, 0);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_chunk_size);
}

TEST_F(ChunkPlanTest, HugeSourceDoesNotOverflow) {
    constexpr auto max_size = std::numeric_limits<uint64_t>::max();

    auto plan = plan_chunks(max_size, 1);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().num_chunks, max_size);
}

TEST_F(ChunkPlanTest, MatchesCeilingDivision) {
    for (uint64_t size : {1ull, 2ull, 99ull, 100ull, 101ull, 1000ull, 12345ull}) {
        for (uint32_t block : {1u, 7u, 100u, 4096u}) {
            auto plan = plan_chunks(size, block);
            ASSERT_TRUE(plan.has_value());
            EXPECT_EQ(plan.value().num_chunks, (size + block - 1) / block)
                << "size=" << size << " block=" << block;
        }
    }
}

TEST_F(ChunkPlanTest, ChunkLengthAndOffset) {
    auto plan = plan_chunks(10 * MiB, 4 * MiB).value();

    EXPECT_EQ(plan.chunk_offset(0), 0u);
    EXPECT_EQ(plan.chunk_offset(2), 8u * MiB);

    auto first = plan.chunk_length(0, 10 * MiB);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 4u * MiB);

    auto last = plan.chunk_length(2, 10 * MiB);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last.value(), 2u * MiB);
}

TEST_F(ChunkPlanTest, ChunkLengthOutOfRange) {
    auto plan = plan_chunks(10 * MiB, 4 * MiB).value();

    auto length = plan.chunk_length(3, 10 * MiB);

    ASSERT_FALSE(length.has_value());
    EXPECT_EQ(length.error().code, error_code::invalid_chunk_index);
}

TEST_F(ChunkPlanTest, EmptyPlanHasNoChunkLength) {
    auto plan = plan_chunks(0, 4 * MiB).value();

    EXPECT_FALSE(plan.chunk_length(0, 0).has_value());
}

}  // namespace hns_transfer::test
