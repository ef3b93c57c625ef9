#include "retrieval_service.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>

RetrievalService::RetrievalService(const RecordStore& store, const SimilarityIndex* index)
    : store_(store), index_(index) {}

std::vector<SearchResult> RetrievalService::search(const std::string& query, size_t n_results,
                                                   double min_liquidity) const {
    if (!index_) {
        throw ConfigurationError("Similarity index not available. Run 'hedger update-index' first.");
    }

    spdlog::info("Semantic search: '{}'", util::truncate(query, 100));
    spdlog::info("Retrieving top {} markets with min_liquidity={}", n_results, min_liquidity);

    auto hits = index_->query(query, n_results, min_liquidity);
    if (hits.empty()) {
        return {};
    }

    std::vector<std::string> ids;
    ids.reserve(hits.size());
    for (const auto& hit : hits) {
        ids.push_back(hit.first);
    }

    auto records = store_.get_by_ids(ids);

    std::vector<SearchResult> results;
    results.reserve(hits.size());
    for (const auto& hit : hits) {
        auto it = records.find(hit.first);
        if (it != records.end()) {
            results.emplace_back(it->second, hit.second);
        }
    }

    if (results.size() < hits.size()) {
        spdlog::debug("{} indexed markets missing from record store", hits.size() - results.size());
    }
    spdlog::info("Retrieved {} markets from semantic search", results.size());
    return results;
}

std::vector<SearchResult> RetrievalService::search_many(const std::vector<std::string>& queries,
                                                        size_t n_results, double min_liquidity) const {
    std::vector<SearchResult> merged;
    std::unordered_map<std::string, size_t> positions;

    for (const auto& query : queries) {
        for (auto& result : search(query, n_results, min_liquidity)) {
            auto it = positions.find(result.first.id);
            if (it == positions.end()) {
                positions.emplace(result.first.id, merged.size());
                merged.push_back(std::move(result));
            } else {
                auto& existing = merged[it->second];
                existing.second = std::max(existing.second, result.second);
            }
        }
    }

    std::stable_sort(merged.begin(), merged.end(),
        [](const SearchResult& a, const SearchResult& b) {
            return a.second > b.second;
        });

    spdlog::info("Multi-query search found {} relevant markets", merged.size());
    return merged;
}
