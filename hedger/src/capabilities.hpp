#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Picks the most relevant candidates of a batch for hedging a concern.
// Returns candidate ids, most relevant first. Throws CapabilityFailure on error or timeout.
class RankingCapability {
public:
    virtual ~RankingCapability() = default;

    virtual std::vector<std::string> rank(const std::vector<MarketRecord>& batch,
                                          const std::string& concern,
                                          const std::string& context,
                                          size_t top_k) = 0;
};

// Groups candidates into named hedge themes. Entry indices are 1-based into records.
// Throws CapabilityFailure on error or timeout.
class ThemeClassifier {
public:
    virtual ~ThemeClassifier() = default;

    virtual std::vector<Theme> classify(const std::vector<MarketRecord>& records,
                                        const std::string& concern,
                                        const std::string& context) = 0;
};
