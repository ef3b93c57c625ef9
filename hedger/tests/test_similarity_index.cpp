#include <gtest/gtest.h>
#include "similarity_index.hpp"
#include "embedder.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

using test_helpers::TempDbPath;
using test_helpers::make_record;

namespace {

// Counts how many texts were embedded
class CountingEmbedder : public Embedder {
public:
    HashingEmbedder inner{64};
    size_t embedded = 0;

    std::vector<Embedding> embed(const std::vector<std::string>& texts) override {
        embedded += texts.size();
        return inner.embed(texts);
    }
    size_t dimension() const override { return inner.dimension(); }
};

std::vector<MarketRecord> sample_records(int n) {
    std::vector<MarketRecord> records;
    for (int i = 0; i < n; ++i) {
        records.push_back(make_record("m" + std::to_string(i), "Market number " + std::to_string(i),
                                      1000.0 * (i + 1)));
    }
    return records;
}

} // namespace

TEST(HashingEmbedderTest, VectorsAreUnitLengthAndDeterministic) {
    HashingEmbedder embedder(128);
    auto first = embedder.embed({"Will the Fed cut rates in June?", ""});
    auto second = embedder.embed({"Will the Fed cut rates in June?"});

    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(first[0].size(), 128u);
    EXPECT_EQ(first[0], second[0]);

    double norm = 0.0;
    for (float v : first[0]) norm += v * v;
    EXPECT_NEAR(std::sqrt(norm), 1.0, 1e-5);

    for (float v : first[1]) EXPECT_EQ(v, 0.0f);
}

TEST(HashingEmbedderTest, ZeroDimensionThrows) {
    EXPECT_THROW(HashingEmbedder(0), std::invalid_argument);
}

class SimilarityIndexTest : public ::testing::Test {
protected:
    TempDbPath db_{"similarity_index_test"};
    CountingEmbedder embedder_;
};

TEST_F(SimilarityIndexTest, DocumentTextJoinsQuestionAndDescription) {
    auto record = make_record("a", "Will BTC hit 100k?");
    EXPECT_EQ(SimilarityIndex::document_text(record), "Will BTC hit 100k?");
    record.description = "Resolves on Coinbase price";
    EXPECT_EQ(SimilarityIndex::document_text(record), "Will BTC hit 100k? Resolves on Coinbase price");
}

TEST_F(SimilarityIndexTest, ResumeSkipsIndexedRecords) {
    SimilarityIndex index(db_.str(), embedder_);
    auto records = sample_records(7);

    EXPECT_EQ(index.upsert(records, false, 3), 7u);
    EXPECT_EQ(index.count(), 7u);
    EXPECT_EQ(embedder_.embedded, 7u);

    EXPECT_EQ(index.upsert(records, true, 3), 0u);
    EXPECT_EQ(index.count(), 7u);
    EXPECT_EQ(embedder_.embedded, 7u);

    records.push_back(make_record("extra", "A brand new market"));
    EXPECT_EQ(index.upsert(records, true, 3), 1u);
    EXPECT_EQ(index.count(), 8u);
    EXPECT_EQ(index.existing_ids().count("extra"), 1u);
}

TEST_F(SimilarityIndexTest, ProgressFiresForEveryBatchIncludingPartialLast) {
    SimilarityIndex index(db_.str(), embedder_);
    std::vector<std::pair<int, int>> calls;

    index.upsert(sample_records(7), false, 3, [&calls](int done, int total) {
        calls.emplace_back(done, total);
    });

    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0], std::make_pair(1, 3));
    EXPECT_EQ(calls[2], std::make_pair(3, 3));
}

TEST_F(SimilarityIndexTest, ThrowingProgressCallbackDoesNotAbortIndexing) {
    SimilarityIndex index(db_.str(), embedder_);
    size_t written = index.upsert(sample_records(5), false, 2, [](int, int) {
        throw std::runtime_error("listener went away");
    });
    EXPECT_EQ(written, 5u);
    EXPECT_EQ(index.count(), 5u);
}

TEST_F(SimilarityIndexTest, NonStandardExceptionFromCallbackDoesNotAbortIndexing) {
    SimilarityIndex index(db_.str(), embedder_);
    int calls = 0;
    size_t written = index.upsert(sample_records(5), false, 2, [&calls](int, int) {
        ++calls;
        throw 42;
    });
    EXPECT_EQ(written, 5u);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(index.count(), 5u);
}

TEST_F(SimilarityIndexTest, UnopenablePathThrows) {
    EXPECT_THROW(SimilarityIndex("/nonexistent-dir/polyhedge/index.db", embedder_), std::runtime_error);
}

TEST_F(SimilarityIndexTest, ZeroBatchSizeIsRejected) {
    SimilarityIndex index(db_.str(), embedder_);
    EXPECT_THROW(index.upsert(sample_records(2), false, 0), std::invalid_argument);
}

TEST_F(SimilarityIndexTest, QueryRanksClosestTextFirst) {
    SimilarityIndex index(db_.str(), embedder_);
    index.upsert({
        make_record("fed", "Will the Federal Reserve cut interest rates in June?"),
        make_record("rain", "Will it rain in London tomorrow?"),
        make_record("btc", "Will Bitcoin close above 100k this year?"),
    });

    auto hits = index.query("Federal Reserve interest rates cut", 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].first, "fed");
    EXPECT_GT(hits[0].second, hits[1].second);
    EXPECT_GT(hits[0].second, 0.0);
    EXPECT_LE(hits[0].second, 1.0);
}

TEST_F(SimilarityIndexTest, QueryHonoursMinimumLiquidityAndActiveFlag) {
    SimilarityIndex index(db_.str(), embedder_);
    auto thin = make_record("thin", "Election turnout above 60 percent", 50.0);
    auto deep = make_record("deep", "Election turnout above 70 percent", 50000.0);
    auto closed = make_record("closed", "Election turnout above 80 percent", 90000.0);
    closed.active = false;
    index.upsert({thin, deep, closed});

    auto hits = index.query("election turnout", 10, 100.0);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].first, "deep");

    EXPECT_EQ(index.query("election turnout", 10).size(), 2u);
    EXPECT_TRUE(index.query("election turnout", 0).empty());
}

TEST_F(SimilarityIndexTest, ClearEmptiesIndex) {
    SimilarityIndex index(db_.str(), embedder_);
    index.upsert(sample_records(4));
    index.clear();
    EXPECT_EQ(index.count(), 0u);
    EXPECT_TRUE(index.is_healthy());
}
