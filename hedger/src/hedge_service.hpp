#pragma once

#include "config.hpp"
#include "capabilities.hpp"
#include "cache_refresher.hpp"
#include "retrieval_service.hpp"
#include "batch_filter.hpp"
#include "portfolio_builder.hpp"
#include "risk_metrics.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct HedgeResult {
    std::vector<HedgeBundle> bundles;
    PortfolioMetrics metrics;
    size_t markets_found = 0;
    size_t markets_filtered = 0;
    double execution_time_seconds = 0.0;

    nlohmann::json to_json() const;
};

// Runs the search, filter, bundle and metrics pipeline
class HedgeService {
public:
    // index may be null; searching then throws ConfigurationError
    HedgeService(const Config& config,
                 const RecordStore& store,
                 const SimilarityIndex* index,
                 CacheRefresher& refresher,
                 RankingCapability& ranker,
                 ThemeClassifier& classifier);

    HedgeResult generate_hedge(const std::string& concern,
                               double budget,
                               size_t num_markets,
                               const std::string& context = "",
                               const ProgressEmitter& progress = nullptr);

    std::vector<SearchResult> search(const std::string& query, size_t n_results, double min_liquidity) const;

    RefreshReport refresh_cache(bool resume = false, const ProgressEmitter& progress = nullptr);
    RefreshReport update_index(bool resume = false, const ProgressEmitter& progress = nullptr);
    nlohmann::json cache_status() const;

private:
    const Config& config_;
    CacheRefresher& refresher_;
    RetrievalService retrieval_;
    BatchFilter filter_;
    PortfolioBuilder builder_;
    RiskMetricsEngine metrics_;
};
