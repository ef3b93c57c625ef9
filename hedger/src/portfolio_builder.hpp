#pragma once
#include "capabilities.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct PortfolioBuilderSettings {
    size_t max_markets_in_bundle = 8;
    double min_adjusted_score = 0.1;
    double max_overlap = 0.5;
};

// Turns candidate records into budget-allocated hedge bundles
class PortfolioBuilder {
public:
    explicit PortfolioBuilder(ThemeClassifier& classifier,
                              PortfolioBuilderSettings settings = PortfolioBuilderSettings());

    // Single diverse bundle from scored candidates
    HedgeBundle build_bundle(const std::vector<ScoredRecord>& scored,
                             double budget,
                             const std::vector<RiskFactor>& risk_factors = {});

    // Greedy scan keeping candidates whose question words mostly differ from those already taken
    std::vector<ScoredRecord> select_diverse(const std::vector<ScoredRecord>& scored, size_t max_count) const;

    std::vector<HedgeBet> allocate_budget(const std::vector<ScoredRecord>& selected, double budget) const;

    // Liquidity, price extremity and volume adjustments, then sorted by adjusted score
    static void apply_score_heuristics(std::vector<ScoredRecord>& scored);

    // One mutually exclusive bundle per theme, each sized against the full budget
    std::vector<HedgeBundle> build_themed_bundles(const std::vector<MarketRecord>& records,
                                                  const std::string& concern,
                                                  double budget,
                                                  const std::string& context = "");

    const PortfolioBuilderSettings& settings() const { return settings_; }

private:
    std::vector<Theme> identify_themes(const std::vector<MarketRecord>& records,
                                       const std::string& concern,
                                       const std::string& context);
    HedgeBundle build_theme_bundle(const Theme& theme,
                                   const std::vector<MarketRecord>& records,
                                   double budget) const;
    static std::vector<std::string> covered_factors(const std::vector<ScoredRecord>& selected,
                                                    const std::vector<RiskFactor>& risk_factors);
    static std::string coverage_summary(const std::vector<HedgeBet>& bets,
                                        const std::vector<std::string>& factors);

    ThemeClassifier& classifier_;
    PortfolioBuilderSettings settings_;
};
