#pragma once

#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Pulls active markets from the Gamma /markets and /events feeds
class MarketFeedClient {
public:
    // Returns one decoded page of a feed, or nullopt when the page could not be fetched
    using PageFetcher = std::function<std::optional<nlohmann::json>(const std::string& feed, int limit, int offset)>;

    explicit MarketFeedClient(const Config& config);
    MarketFeedClient(const Config& config, PageFetcher fetcher);
    ~MarketFeedClient();

    // Both feeds merged, deduplicated by id
    std::vector<MarketRecord> fetch_all();

    std::vector<MarketRecord> fetch_markets_feed();
    std::vector<MarketRecord> fetch_events_feed();

    static std::optional<MarketRecord> parse_market(const nlohmann::json& item);

    // Later feeds win on duplicate ids; order of first appearance is kept
    static std::vector<MarketRecord> merge_feeds(const std::vector<MarketRecord>& first,
                                                 const std::vector<MarketRecord>& second);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
