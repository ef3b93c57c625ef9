#include "batch_filter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

BatchFilter::BatchFilter(RankingCapability& ranker) : ranker_(ranker) {}

std::vector<MarketRecord> BatchFilter::filter_in_batches(const std::vector<MarketRecord>& candidates,
                                                         const std::string& concern,
                                                         size_t batch_size,
                                                         size_t top_k_per_batch,
                                                         const std::string& context) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }

    size_t total_batches = (candidates.size() + batch_size - 1) / batch_size;
    spdlog::info("Processing {} markets in {} batches of {}, keeping top {} per batch",
                 candidates.size(), total_batches, batch_size, top_k_per_batch);

    std::vector<MarketRecord> all_filtered;

    for (size_t batch_num = 0; batch_num < total_batches; ++batch_num) {
        size_t start = batch_num * batch_size;
        size_t end = std::min(start + batch_size, candidates.size());
        std::vector<MarketRecord> batch(candidates.begin() + start, candidates.begin() + end);

        spdlog::info("Processing batch {}/{} ({} markets)", batch_num + 1, total_batches, batch.size());

        auto filtered = filter_batch(batch, concern, top_k_per_batch, context);

        spdlog::info("Batch {}/{} complete, kept {} markets", batch_num + 1, total_batches, filtered.size());
        all_filtered.insert(all_filtered.end(),
                            std::make_move_iterator(filtered.begin()),
                            std::make_move_iterator(filtered.end()));
    }

    spdlog::info("Total filtered markets: {}", all_filtered.size());
    return all_filtered;
}

std::vector<MarketRecord> BatchFilter::filter_batch(const std::vector<MarketRecord>& batch,
                                                    const std::string& concern,
                                                    size_t top_k,
                                                    const std::string& context) {
    if (batch.empty()) {
        return {};
    }

    std::vector<std::string> selected_ids;
    try {
        selected_ids = ranker_.rank(batch, concern, context, top_k);
    } catch (const std::exception& e) {
        spdlog::error("Ranking capability error: {}", e.what());
        spdlog::warn("Falling back to liquidity-based selection");
        return liquidity_fallback(batch, top_k);
    }

    std::unordered_map<std::string, const MarketRecord*> by_id;
    for (const auto& record : batch) {
        by_id.emplace(record.id, &record);
    }

    std::vector<MarketRecord> filtered;
    std::unordered_set<std::string> taken;
    for (const auto& id : selected_ids) {
        if (filtered.size() >= top_k) {
            break;
        }
        auto it = by_id.find(id);
        if (it == by_id.end()) {
            spdlog::debug("Ignoring ranked id {} not present in batch", id);
            continue;
        }
        if (taken.insert(id).second) {
            filtered.push_back(*it->second);
        }
    }

    spdlog::debug("Selected {} markets from batch of {}", filtered.size(), batch.size());
    return filtered;
}

std::vector<MarketRecord> BatchFilter::liquidity_fallback(const std::vector<MarketRecord>& batch, size_t top_k) {
    std::vector<MarketRecord> sorted = batch;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const MarketRecord& a, const MarketRecord& b) {
            return a.liquidity > b.liquidity;
        });
    if (sorted.size() > top_k) {
        sorted.resize(top_k);
    }
    return sorted;
}
