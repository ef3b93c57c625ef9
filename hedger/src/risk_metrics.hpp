#pragma once
#include "config.hpp"
#include "types.hpp"
#include <vector>

// Heuristic risk and return figures for hedge bundles.
// Prices are read as outcome probabilities.
class RiskMetricsEngine {
public:
    explicit RiskMetricsEngine(const MetricsConstants& constants = MetricsConstants());

    PortfolioMetrics calculate_portfolio_metrics(const std::vector<HedgeBundle>& bundles) const;

    BundleMetrics calculate_bundle_metrics(const HedgeBundle& bundle) const;

private:
    double overall_risk(const std::vector<double>& prices) const;
    double expected_return(const std::vector<HedgeBundle>& bundles) const;
    double sharpe(double expected, double volatility) const;

    MetricsConstants constants_;
};
