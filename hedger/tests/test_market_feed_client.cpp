#include <gtest/gtest.h>
#include "market_feed_client.hpp"
#include "test_helpers.hpp"
#include <map>

using json = nlohmann::json;
using test_helpers::make_record;

namespace {

json market_json(const std::string& id, const std::string& question) {
    return json{
        {"id", id},
        {"question", question},
        {"outcomes", "[\"Yes\", \"No\"]"},
        {"outcomePrices", "[\"0.3\", \"0.7\"]"},
        {"liquidity", "1500.5"},
        {"volume", 2000}
    };
}

json page_of(int count, int start) {
    json page = json::array();
    for (int i = 0; i < count; ++i) {
        page.push_back(market_json("m" + std::to_string(start + i), "Question " + std::to_string(start + i)));
    }
    return page;
}

// Serves canned pages per feed and records every request
class FakeGamma {
public:
    std::map<std::string, std::vector<std::optional<json>>> pages;
    std::vector<std::pair<std::string, int>> requests;

    void add(const std::string& feed, const json& page) {
        pages[feed].emplace_back(page);
    }

    // Queues a failed request
    void fail(const std::string& feed) {
        pages[feed].emplace_back(std::nullopt);
    }

    MarketFeedClient::PageFetcher fetcher() {
        return [this](const std::string& feed, int, int offset) -> std::optional<json> {
            requests.emplace_back(feed, offset);
            auto& queue = pages[feed];
            if (queue.empty()) {
                return std::make_optional(json::array());
            }
            auto page = queue.front();
            queue.erase(queue.begin());
            return page;
        };
    }
};

Config test_config() {
    Config config;
    config.feed_page_size = 3;
    config.feed_max_retries = 2;
    config.base_backoff_seconds = 0.001;
    config.max_backoff_seconds = 0.005;
    return config;
}

} // namespace

TEST(MarketFeedParseTest, DecodesStringEncodedLists) {
    auto record = MarketFeedClient::parse_market(market_json("42", "Will it snow?"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, "42");
    ASSERT_EQ(record->outcomes.size(), 2u);
    EXPECT_EQ(record->outcomes[0].name, "Yes");
    EXPECT_DOUBLE_EQ(record->outcomes[0].price, 0.3);
    EXPECT_DOUBLE_EQ(record->outcomes[1].price, 0.7);
    EXPECT_DOUBLE_EQ(record->liquidity, 1500.5);
    EXPECT_DOUBLE_EQ(record->volume, 2000.0);
    EXPECT_TRUE(record->active);
    EXPECT_EQ(*record->slug, "42");
}

TEST(MarketFeedParseTest, AppliesDefaultsAndFallbacks) {
    json item = {
        {"id", 1234},
        {"question", "Who wins?"},
        {"outcomePrices", json::array({0.2, 0.5, 0.3})},
        {"liquidity", 0},
        {"liquidityNum", 800.0},
        {"volumeNum", "55"},
        {"conditionId", "0xabc"},
        {"endDate", "2026-11-03T00:00:00Z"}
    };

    auto record = MarketFeedClient::parse_market(item);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, "1234");
    ASSERT_EQ(record->outcomes.size(), 3u);
    EXPECT_EQ(record->outcomes[0].name, "Yes");
    EXPECT_EQ(record->outcomes[1].name, "No");
    EXPECT_EQ(record->outcomes[2].name, "Outcome 3");
    EXPECT_DOUBLE_EQ(record->liquidity, 800.0);
    EXPECT_DOUBLE_EQ(record->volume, 55.0);
    EXPECT_EQ(*record->slug, "0xabc");
    EXPECT_EQ(*record->end_date, "2026-11-03T00:00:00Z");
    EXPECT_TRUE(record->description.empty());
}

TEST(MarketFeedParseTest, RejectsItemsWithoutId) {
    EXPECT_FALSE(MarketFeedClient::parse_market(json{{"question", "orphan"}}).has_value());
    EXPECT_FALSE(MarketFeedClient::parse_market(json::array()).has_value());

    auto unpriced = MarketFeedClient::parse_market(json{{"id", "x"}, {"outcomePrices", "not json"}});
    ASSERT_TRUE(unpriced.has_value());
    EXPECT_TRUE(unpriced->outcomes.empty());
}

TEST(MarketFeedClientTest, PagingStopsOnShortPage) {
    auto config = test_config();
    FakeGamma gamma;
    gamma.add("markets", page_of(3, 0));
    gamma.add("markets", page_of(2, 3));
    MarketFeedClient client(config, gamma.fetcher());

    auto records = client.fetch_markets_feed();

    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(records[4].id, "m4");
    ASSERT_EQ(gamma.requests.size(), 2u);
    EXPECT_EQ(gamma.requests[1].second, 3);
}

TEST(MarketFeedClientTest, PagingStopsAtMaxMarkets) {
    auto config = test_config();
    config.feed_max_markets = 4;
    FakeGamma gamma;
    for (int start : {0, 3, 6}) {
        gamma.add("markets", page_of(3, start));
    }
    MarketFeedClient client(config, gamma.fetcher());

    auto records = client.fetch_markets_feed();
    EXPECT_EQ(records.size(), 6u);
    EXPECT_EQ(gamma.requests.size(), 2u);
}

TEST(MarketFeedClientTest, RetriesThenGivesUpKeepingEarlierPages) {
    auto config = test_config();
    FakeGamma gamma;
    gamma.add("markets", page_of(3, 0));
    for (int i = 0; i < 3; ++i) {
        gamma.fail("markets");
    }
    MarketFeedClient client(config, gamma.fetcher());

    auto records = client.fetch_markets_feed();

    EXPECT_EQ(records.size(), 3u);
    // one successful page plus three attempts at offset 3
    EXPECT_EQ(gamma.requests.size(), 4u);
}

TEST(MarketFeedClientTest, TransientFailureIsRetried) {
    auto config = test_config();
    FakeGamma gamma;
    gamma.fail("markets");
    gamma.add("markets", page_of(2, 0));
    MarketFeedClient client(config, gamma.fetcher());

    auto records = client.fetch_markets_feed();
    EXPECT_EQ(records.size(), 2u);
    EXPECT_EQ(gamma.requests.size(), 2u);
}

TEST(MarketFeedClientTest, EventMarketsInheritEventFields) {
    auto config = test_config();
    FakeGamma gamma;
    auto own = market_json("e1", "Has own description");
    own["description"] = "Market level";
    own["slug"] = "market-slug";
    gamma.add("events", json::array({
        json{{"slug", "election-2026"},
             {"description", "Event level"},
             {"markets", json::array({market_json("e2", "Inherits"), own})}},
        json{{"slug", "no-markets"}}
    }));
    MarketFeedClient client(config, gamma.fetcher());

    auto records = client.fetch_events_feed();

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "e2");
    EXPECT_EQ(records[0].description, "Event level");
    EXPECT_EQ(*records[0].slug, "election-2026");
    EXPECT_EQ(records[1].description, "Market level");
    EXPECT_EQ(*records[1].slug, "election-2026");
}

TEST(MarketFeedClientTest, FetchAllMergesFeedsWithEventsWinning) {
    auto config = test_config();
    FakeGamma gamma;
    gamma.add("markets", json::array({market_json("a", "From markets"), market_json("b", "Only markets")}));
    gamma.add("events", json::array({
        json{{"slug", "ev"}, {"description", "Event"}, {"markets", json::array({market_json("a", "From events")})}}
    }));
    MarketFeedClient client(config, gamma.fetcher());

    auto records = client.fetch_all();

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "a");
    EXPECT_EQ(records[0].question, "From events");
    EXPECT_EQ(records[1].id, "b");
}

TEST(MarketFeedClientTest, MergeFeedsKeepsFirstAppearanceOrder) {
    auto merged = MarketFeedClient::merge_feeds(
        {make_record("x", "x1"), make_record("y", "y1")},
        {make_record("z", "z2"), make_record("x", "x2")});

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].id, "x");
    EXPECT_EQ(merged[0].question, "x2");
    EXPECT_EQ(merged[1].id, "y");
    EXPECT_EQ(merged[2].id, "z");
}
