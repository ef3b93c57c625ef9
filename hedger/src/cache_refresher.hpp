#pragma once

#include "config.hpp"
#include "record_store.hpp"
#include "similarity_index.hpp"
#include "market_feed_client.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

// Receives {"type": ..., "data": {...}} progress events
using ProgressEmitter = std::function<void(const nlohmann::json&)>;

// Sends one progress event; a throwing emitter is logged and ignored
void emit_progress(const ProgressEmitter& progress, const std::string& type, nlohmann::json data);

struct RefreshReport {
    bool success = false;
    size_t fetched = 0;
    size_t indexed = 0;

    nlohmann::json to_json() const;
};

// Keeps the record store and similarity index in step with the source feeds
class CacheRefresher {
public:
    // index and feed may be null; operations needing them throw ConfigurationError
    CacheRefresher(const Config& config, RecordStore& store, SimilarityIndex* index, MarketFeedClient* feed);

    // Fetch both feeds, replace the store, then index the stored records.
    // An empty fetch or failed store write keeps the previous cache.
    RefreshReport refresh_cache(bool resume = false, const ProgressEmitter& progress = nullptr);

    // Re-index the stored records without fetching
    RefreshReport update_index(bool resume = false, const ProgressEmitter& progress = nullptr);

    nlohmann::json cache_status() const;

private:
    size_t index_stored(bool resume, const ProgressEmitter& progress);

    const Config& config_;
    RecordStore& store_;
    SimilarityIndex* index_;
    MarketFeedClient* feed_;
};
