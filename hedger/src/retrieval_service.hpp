#pragma once
#include "record_store.hpp"
#include "similarity_index.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <utility>

using SearchResult = std::pair<MarketRecord, double>;

// Semantic search over the cached records
class RetrievalService {
public:
    // index may be null when vector search is not configured; search() then throws ConfigurationError
    RetrievalService(const RecordStore& store, const SimilarityIndex* index);

    // Best n_results records for the query, most similar first.
    // Ids present in the index but missing from the store are dropped.
    std::vector<SearchResult> search(const std::string& query, size_t n_results, double min_liquidity) const;

    // Runs search per query and keeps each record's best score, sorted by descending score
    std::vector<SearchResult> search_many(const std::vector<std::string>& queries,
                                          size_t n_results, double min_liquidity) const;

private:
    const RecordStore& store_;
    const SimilarityIndex* index_;
};
