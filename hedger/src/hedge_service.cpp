#include "hedge_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>

using json = nlohmann::json;

json HedgeResult::to_json() const {
    json j;
    j["bundles"] = json::array();
    for (const auto& bundle : bundles) {
        j["bundles"].push_back(bundle.to_json());
    }
    j["metrics"] = metrics.to_json();
    j["markets_found"] = markets_found;
    j["markets_filtered"] = markets_filtered;
    j["execution_time_seconds"] = execution_time_seconds;
    return j;
}

HedgeService::HedgeService(const Config& config,
                           const RecordStore& store,
                           const SimilarityIndex* index,
                           CacheRefresher& refresher,
                           RankingCapability& ranker,
                           ThemeClassifier& classifier)
    : config_(config),
      refresher_(refresher),
      retrieval_(store, index),
      filter_(ranker),
      builder_(classifier, PortfolioBuilderSettings{static_cast<size_t>(config.max_markets_in_bundle), 0.1, 0.5}),
      metrics_(config.metrics) {
    spdlog::info("HedgeService initialized");
}

HedgeResult HedgeService::generate_hedge(const std::string& concern,
                                         double budget,
                                         size_t num_markets,
                                         const std::string& context,
                                         const ProgressEmitter& progress) {
    auto start_time = std::chrono::steady_clock::now();
    spdlog::info("Generating hedge for concern: '{}', budget=${}, num_markets={}",
                 util::truncate(concern, 50), budget, num_markets);

    emit_progress(progress, "started", {{"concern", concern}, {"budget", budget}});

    HedgeResult result;
    try {
        emit_progress(progress, "progress",
                      {{"step", "search"}, {"message", fmt::format("Searching {} markets...", num_markets)}});
        auto found = retrieval_.search(concern, num_markets, config_.min_liquidity);
        std::vector<MarketRecord> candidates;
        candidates.reserve(found.size());
        for (auto& hit : found) {
            candidates.push_back(std::move(hit.first));
        }
        result.markets_found = candidates.size();
        spdlog::info("Found {} markets", candidates.size());
        emit_progress(progress, "search_complete", {{"markets_found", result.markets_found}});

        emit_progress(progress, "progress", {{"step", "filter"}, {"message", "Filtering markets..."}});
        auto filtered = filter_.filter_in_batches(candidates, concern,
                                                  static_cast<size_t>(config_.filter_batch_size),
                                                  static_cast<size_t>(config_.filter_top_k),
                                                  context);
        result.markets_filtered = filtered.size();
        spdlog::info("Filtered to {} markets", filtered.size());
        emit_progress(progress, "filter_complete", {{"markets_filtered", result.markets_filtered}});

        emit_progress(progress, "progress",
                      {{"step", "bundles"}, {"message", "Generating themed portfolios..."}});
        result.bundles = builder_.build_themed_bundles(filtered, concern, budget, context);
        spdlog::info("Generated {} bundles", result.bundles.size());
        emit_progress(progress, "bundles_complete", {{"num_bundles", result.bundles.size()}});

        result.metrics = metrics_.calculate_portfolio_metrics(result.bundles);
    } catch (const std::exception& e) {
        spdlog::error("Hedge generation failed: {}", e.what());
        emit_progress(progress, "error", {{"message", e.what()}});
        throw;
    }

    result.execution_time_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("Hedge generation complete in {:.2f}s", result.execution_time_seconds);

    emit_progress(progress, "complete", result.to_json());
    return result;
}

std::vector<SearchResult> HedgeService::search(const std::string& query, size_t n_results, double min_liquidity) const {
    return retrieval_.search(query, n_results, min_liquidity);
}

RefreshReport HedgeService::refresh_cache(bool resume, const ProgressEmitter& progress) {
    return refresher_.refresh_cache(resume, progress);
}

RefreshReport HedgeService::update_index(bool resume, const ProgressEmitter& progress) {
    return refresher_.update_index(resume, progress);
}

json HedgeService::cache_status() const {
    return refresher_.cache_status();
}
