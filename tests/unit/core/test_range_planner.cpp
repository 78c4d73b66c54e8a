/**
 * @file test_range_planner.cpp
 * @brief Unit tests for range_planner
 */

#include <gtest/gtest.h>

#include <kcenon/parallel_fetch/core/range_planner.h>

#include <algorithm>
#include <numeric>
#include <vector>

namespace kcenon::parallel_fetch::test {

namespace {

// Ranges are ordered, contiguous and cover [0, total_size)
void expect_partition(const std::vector<chunk_range>& ranges, uint64_t total_size) {
    ASSERT_FALSE(ranges.empty());
    uint64_t cursor = 0;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].index, i);
        EXPECT_FALSE(ranges[i].empty);
        EXPECT_EQ(ranges[i].start, cursor);
        EXPECT_LE(ranges[i].start, ranges[i].end);
        cursor = ranges[i].end + 1;
    }
    EXPECT_EQ(cursor, total_size);
}

}  // namespace

class RangePlannerTest : public ::testing::Test {};

TEST_F(RangePlannerTest, EvenSplit) {
    auto result = range_planner::plan(1000, 4);
    ASSERT_TRUE(result.has_value());

    const auto& ranges = result.value();
    ASSERT_EQ(ranges.size(), 4);
    EXPECT_EQ(ranges[0], chunk_range(0, 0, 249));
    EXPECT_EQ(ranges[1], chunk_range(1, 250, 499));
    EXPECT_EQ(ranges[2], chunk_range(2, 500, 749));
    EXPECT_EQ(ranges[3], chunk_range(3, 750, 999));
}

TEST_F(RangePlannerTest, LastRangeAbsorbsRemainder) {
    auto result = range_planner::plan(10, 3);
    ASSERT_TRUE(result.has_value());

    const auto& ranges = result.value();
    ASSERT_EQ(ranges.size(), 3);
    EXPECT_EQ(ranges[0], chunk_range(0, 0, 2));
    EXPECT_EQ(ranges[1], chunk_range(1, 3, 5));
    EXPECT_EQ(ranges[2], chunk_range(2, 6, 9));
    EXPECT_EQ(ranges[2].length(), 4);
}

TEST_F(RangePlannerTest, SingleRange) {
    auto result = range_planner::plan(12345, 1);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 1);
    EXPECT_EQ(result.value()[0], chunk_range(0, 0, 12344));
}

TEST_F(RangePlannerTest, ZeroSizeYieldsOneEmptyRange) {
    auto result = range_planner::plan(0, 8);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 1);
    EXPECT_TRUE(result.value()[0].empty);
    EXPECT_EQ(result.value()[0].length(), 0);
}

TEST_F(RangePlannerTest, ZeroParallelismIsRejected) {
    auto result = range_planner::plan(1000, 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_parallelism);
}

TEST_F(RangePlannerTest, ParallelismClampedToSize) {
    auto result = range_planner::plan(3, 10);
    ASSERT_TRUE(result.has_value());

    const auto& ranges = result.value();
    ASSERT_EQ(ranges.size(), 3);
    for (const auto& r : ranges) {
        EXPECT_EQ(r.length(), 1);
    }
    expect_partition(ranges, 3);
}

TEST_F(RangePlannerTest, EffectiveParallelism) {
    EXPECT_EQ(range_planner::effective_parallelism(1000, 4), 4);
    EXPECT_EQ(range_planner::effective_parallelism(3, 10), 3);
    EXPECT_EQ(range_planner::effective_parallelism(0, 10), 1);
    EXPECT_EQ(range_planner::effective_parallelism(100, 0), 0);
}

TEST_F(RangePlannerTest, PartitionHoldsAcrossSizes) {
    const std::vector<uint64_t> sizes = {1, 2, 7, 99, 100, 101, 4096, 1000003};
    const std::vector<uint32_t> parallelisms = {1, 2, 3, 4, 7, 16, 64};

    for (auto size : sizes) {
        for (auto n : parallelisms) {
            SCOPED_TRACE("size=" + std::to_string(size) + " n=" + std::to_string(n));
            auto result = range_planner::plan(size, n);
            ASSERT_TRUE(result.has_value());

            const auto& ranges = result.value();
            EXPECT_EQ(ranges.size(), std::min<uint64_t>(n, size));
            expect_partition(ranges, size);

            const auto total = std::accumulate(
                ranges.begin(), ranges.end(), uint64_t{0},
                [](uint64_t sum, const chunk_range& r) { return sum + r.length(); });
            EXPECT_EQ(total, size);

            // Every range but the last has the base size
            const uint64_t base = size / ranges.size();
            for (std::size_t i = 0; i + 1 < ranges.size(); ++i) {
                EXPECT_EQ(ranges[i].length(), base);
            }
        }
    }
}

TEST_F(RangePlannerTest, LargeResource) {
    const uint64_t size = 5ULL * 1024 * 1024 * 1024;  // 5GB
    auto result = range_planner::plan(size, 8);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().size(), 8);
    EXPECT_EQ(result.value().back().end, size - 1);
}

}  // namespace kcenon::parallel_fetch::test
