#include "risk_metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// ddof 0 gives the population variance, 1 the sample variance
double variance(const std::vector<double>& values, int ddof) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return sum_sq / static_cast<double>(values.size() - ddof);
}

std::string theme_name_of(const std::string& summary, const std::string& fallback) {
    auto pos = summary.find(':');
    if (pos == std::string::npos) {
        return fallback;
    }
    return summary.substr(0, pos);
}

} // namespace

RiskMetricsEngine::RiskMetricsEngine(const MetricsConstants& constants) : constants_(constants) {}

PortfolioMetrics RiskMetricsEngine::calculate_portfolio_metrics(const std::vector<HedgeBundle>& bundles) const {
    spdlog::info("Calculating portfolio metrics for {} bundles", bundles.size());

    PortfolioMetrics metrics;
    if (bundles.empty()) {
        return metrics;
    }

    std::vector<double> prices;
    double weighted_multiplier_sum = 0.0;

    for (const auto& bundle : bundles) {
        metrics.bundle_metrics.push_back(calculate_bundle_metrics(bundle));
        metrics.total_allocated += bundle.total_allocated;
        metrics.total_markets += static_cast<int>(bundle.bets.size());
        for (const auto& bet : bundle.bets) {
            prices.push_back(bet.current_price);
            metrics.total_max_payout += bet.potential_payout;
            weighted_multiplier_sum += bet.allocation * bet.payout_multiplier;
        }
    }

    int num_bundles = static_cast<int>(bundles.size());
    metrics.total_budget = bundles.front().budget;
    metrics.num_bundles = num_bundles;

    metrics.overall_risk_score = overall_risk(prices);
    metrics.portfolio_volatility = std::sqrt(variance(prices, 0));
    metrics.expected_return = expected_return(bundles);
    metrics.sharpe_ratio = sharpe(metrics.expected_return, metrics.portfolio_volatility);

    metrics.correlation_score = std::max(0.0, 1.0 - (num_bundles - 1) * constants_.correlation_step);
    metrics.sector_diversity_score = std::min(num_bundles / constants_.sector_target * 100.0, 100.0);

    metrics.weighted_avg_multiplier = metrics.total_allocated > 0.0
        ? weighted_multiplier_sum / metrics.total_allocated
        : 1.0;

    spdlog::info("Portfolio metrics calculated: risk={:.1f}, sharpe={:.2f}, expected_return={:.2f}%",
                 metrics.overall_risk_score, metrics.sharpe_ratio, metrics.expected_return * 100.0);
    return metrics;
}

BundleMetrics RiskMetricsEngine::calculate_bundle_metrics(const HedgeBundle& bundle) const {
    BundleMetrics m;
    if (bundle.bets.empty()) {
        m.theme_name = theme_name_of(bundle.coverage_summary, "Empty Bundle");
        return m;
    }

    std::vector<double> prices, allocations, multipliers, payouts, liquidities;
    for (const auto& bet : bundle.bets) {
        prices.push_back(bet.current_price);
        allocations.push_back(bet.allocation);
        multipliers.push_back(bet.payout_multiplier);
        payouts.push_back(bet.potential_payout);
        liquidities.push_back(bet.market.record.liquidity);
    }

    double total_alloc = std::accumulate(allocations.begin(), allocations.end(), 0.0);

    if (total_alloc > 0.0) {
        double portfolio_variance = 0.0;
        for (size_t i = 0; i < prices.size(); ++i) {
            double w = allocations[i] / total_alloc;
            portfolio_variance += w * w * prices[i] * (1.0 - prices[i]);
        }
        double risk_base = std::min(std::sqrt(portfolio_variance) * constants_.risk_std_scale, 100.0);

        std::vector<double> distances;
        for (double p : prices) {
            distances.push_back(std::abs(p - 0.5));
        }
        double avg_individual_risk = (1.0 - mean(distances) * 2.0) * 100.0;

        m.risk_score = constants_.portfolio_risk_weight * risk_base +
                       constants_.individual_risk_weight * avg_individual_risk;

        double expected_value = 0.0;
        for (const auto& bet : bundle.bets) {
            expected_value += bet.allocation * bet.current_price * bet.payout_multiplier;
        }
        m.expected_return = (expected_value - total_alloc) / total_alloc;
    }

    m.volatility = std::sqrt(variance(prices, 1));
    m.sharpe_ratio = sharpe(m.expected_return, m.volatility);
    m.diversification_score = std::min(variance(prices, 0) * constants_.diversification_scale, 100.0);
    m.liquidity_score = std::min(mean(liquidities) / constants_.liquidity_reference * 100.0, 100.0);

    m.theme_name = theme_name_of(bundle.coverage_summary, "Bundle");
    m.total_allocation = bundle.total_allocated;
    m.num_markets = static_cast<int>(bundle.bets.size());
    m.avg_payout_multiplier = mean(multipliers);
    m.max_payout = *std::max_element(payouts.begin(), payouts.end());
    m.min_payout = *std::min_element(payouts.begin(), payouts.end());
    m.total_max_payout = std::accumulate(payouts.begin(), payouts.end(), 0.0);

    spdlog::debug("Bundle '{}': risk={:.1f}, sharpe={:.2f}, expected_return={:.2f}%, volatility={:.3f}",
                  m.theme_name, m.risk_score, m.sharpe_ratio, m.expected_return * 100.0, m.volatility);
    return m;
}

double RiskMetricsEngine::overall_risk(const std::vector<double>& prices) const {
    if (prices.empty()) {
        return 50.0;
    }
    return (1.0 - std::abs(mean(prices) - 0.5) * 2.0) * 100.0;
}

double RiskMetricsEngine::expected_return(const std::vector<HedgeBundle>& bundles) const {
    double total_alloc = 0.0;
    double expected_value = 0.0;
    for (const auto& bundle : bundles) {
        total_alloc += bundle.total_allocated;
        for (const auto& bet : bundle.bets) {
            expected_value += bet.allocation * bet.current_price * bet.payout_multiplier;
        }
    }
    if (total_alloc <= 0.0) {
        return 0.0;
    }
    return (expected_value - total_alloc) / total_alloc;
}

double RiskMetricsEngine::sharpe(double expected, double volatility) const {
    if (volatility <= 0.0) {
        return 0.0;
    }
    return (expected - constants_.risk_free_rate) / volatility;
}
