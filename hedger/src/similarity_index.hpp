#pragma once
#include "embedder.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <unordered_set>
#include <optional>
#include <functional>
#include <memory>
#include <utility>

// Called after every processed batch with (completed_batches, total_batches)
using ProgressCallback = std::function<void(int, int)>;

// Vector index over market text persisted in SQLite. Queries are exact L2 nearest neighbours.
class SimilarityIndex {
public:
    SimilarityIndex(const std::string& db_path, Embedder& embedder);
    ~SimilarityIndex();

    // Embeds and stores records in batches. With resume, records already indexed are skipped.
    // Returns the number of records written.
    size_t upsert(const std::vector<MarketRecord>& records,
                  bool resume = false,
                  size_t batch_size = 100,
                  const ProgressCallback& progress = nullptr);

    // Up to k (id, similarity) pairs among active records, most similar first.
    // similarity = 1 / (1 + L2 distance)
    std::vector<std::pair<std::string, double>> query(const std::string& text,
                                                      size_t k,
                                                      std::optional<double> min_liquidity = std::nullopt) const;

    std::unordered_set<std::string> existing_ids() const;
    size_t count() const;
    void clear();

    bool is_healthy() const;

    // Text that gets embedded for a record
    static std::string document_text(const MarketRecord& record);

    // Non-copyable
    SimilarityIndex(const SimilarityIndex&) = delete;
    SimilarityIndex& operator=(const SimilarityIndex&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
