#pragma once
#include "capabilities.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Prunes a candidate list by asking the ranking capability about one fixed-size batch at a time.
class BatchFilter {
public:
    explicit BatchFilter(RankingCapability& ranker);

    // Top top_k_per_batch records of each batch, concatenated in batch order.
    // A batch whose ranking call fails falls back to its most liquid records.
    std::vector<MarketRecord> filter_in_batches(const std::vector<MarketRecord>& candidates,
                                                const std::string& concern,
                                                size_t batch_size,
                                                size_t top_k_per_batch,
                                                const std::string& context = "");

    std::vector<MarketRecord> filter_batch(const std::vector<MarketRecord>& batch,
                                           const std::string& concern,
                                           size_t top_k,
                                           const std::string& context = "");

    // Most liquid records first, ties kept in input order
    static std::vector<MarketRecord> liquidity_fallback(const std::vector<MarketRecord>& batch, size_t top_k);

private:
    RankingCapability& ranker_;
};
