#include <gtest/gtest.h>
#include "batch_filter.hpp"
#include "test_helpers.hpp"

using test_helpers::FakeRanker;
using test_helpers::PassThroughRanker;
using test_helpers::make_record;

namespace {

std::vector<MarketRecord> candidates(int n) {
    std::vector<MarketRecord> records;
    for (int i = 0; i < n; ++i) {
        // liquidity rises and falls so the fallback order differs from input order
        double liquidity = static_cast<double>((i * 37) % 100) * 100.0;
        records.push_back(make_record("c" + std::to_string(i), "Candidate " + std::to_string(i), liquidity));
    }
    return records;
}

} // namespace

TEST(BatchFilterTest, FailingRankerFallsBackToMostLiquid) {
    FakeRanker ranker;
    ranker.fail = true;
    BatchFilter filter(ranker);

    auto batch = candidates(25);
    auto kept = filter.filter_batch(batch, "recession", 10);

    ASSERT_EQ(kept.size(), 10u);
    for (size_t i = 1; i < kept.size(); ++i) {
        EXPECT_GE(kept[i - 1].liquidity, kept[i].liquidity);
    }
    double max_liquidity = 0.0;
    for (const auto& r : batch) max_liquidity = std::max(max_liquidity, r.liquidity);
    EXPECT_DOUBLE_EQ(kept[0].liquidity, max_liquidity);
}

TEST(BatchFilterTest, FallbackReturnsWholeBatchWhenSmallerThanTopK) {
    FakeRanker ranker;
    ranker.fail = true;
    BatchFilter filter(ranker);

    auto kept = filter.filter_batch(candidates(4), "recession", 10);
    EXPECT_EQ(kept.size(), 4u);
}

TEST(BatchFilterTest, FallbackKeepsInputOrderOnEqualLiquidity) {
    std::vector<MarketRecord> batch = {
        make_record("a", "A", 500.0),
        make_record("b", "B", 900.0),
        make_record("c", "C", 500.0),
        make_record("d", "D", 500.0),
    };
    auto kept = BatchFilter::liquidity_fallback(batch, 3);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].id, "b");
    EXPECT_EQ(kept[1].id, "a");
    EXPECT_EQ(kept[2].id, "c");
}

TEST(BatchFilterTest, RankedIdsAreFilteredDeduplicatedAndTruncated) {
    FakeRanker ranker;
    ranker.ids = {"c3", "unknown", "c1", "c3", "c0", "c2"};
    BatchFilter filter(ranker);

    auto kept = filter.filter_batch(candidates(5), "recession", 3);

    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].id, "c3");
    EXPECT_EQ(kept[1].id, "c1");
    EXPECT_EQ(kept[2].id, "c0");
}

TEST(BatchFilterTest, EmptyRankingYieldsEmptyBatchResult) {
    FakeRanker ranker;
    BatchFilter filter(ranker);
    EXPECT_TRUE(filter.filter_batch(candidates(5), "recession", 3).empty());
    EXPECT_TRUE(filter.filter_batch({}, "recession", 3).empty());
    EXPECT_EQ(ranker.calls, 1);
}

TEST(BatchFilterTest, BatchesAreConcatenatedInOrder) {
    PassThroughRanker ranker;
    BatchFilter filter(ranker);

    auto kept = filter.filter_in_batches(candidates(25), "recession", 10, 2);

    ASSERT_EQ(kept.size(), 6u);
    EXPECT_EQ(kept[0].id, "c0");
    EXPECT_EQ(kept[1].id, "c1");
    EXPECT_EQ(kept[2].id, "c10");
    EXPECT_EQ(kept[4].id, "c20");
    EXPECT_EQ(kept[5].id, "c21");
}

TEST(BatchFilterTest, EveryBatchFallsBackIndependently) {
    FakeRanker ranker;
    ranker.fail = true;
    BatchFilter filter(ranker);

    auto kept = filter.filter_in_batches(candidates(25), "recession", 10, 4);
    EXPECT_EQ(kept.size(), 4u + 4u + 4u);
    EXPECT_EQ(ranker.calls, 3);
}

TEST(BatchFilterTest, ZeroBatchSizeIsRejected) {
    PassThroughRanker ranker;
    BatchFilter filter(ranker);
    EXPECT_THROW(filter.filter_in_batches(candidates(3), "recession", 0, 2), std::invalid_argument);
}
