#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

struct Outcome {
    std::string name;
    double price = 0.0;  // probability in [0, 1]

    nlohmann::json to_json() const;
    static Outcome from_json(const nlohmann::json& j);
};

// Canonical prediction market record as cached locally
struct MarketRecord {
    std::string id;
    std::string question;
    std::string description;
    std::vector<Outcome> outcomes;
    double liquidity = 0.0;
    double volume = 0.0;
    std::optional<std::string> end_date;
    bool active = true;
    std::optional<std::string> slug;

    std::optional<std::string> url() const;

    nlohmann::json to_json() const;
    // Throws DeserializationError on malformed input
    static MarketRecord from_json(const nlohmann::json& j);
};

enum class CorrelationDirection {
    Positive,
    Negative
};

std::string to_string(CorrelationDirection direction);
CorrelationDirection correlation_direction_from_string(const std::string& value);

struct ScoredRecord {
    MarketRecord record;
    double relevance_score = 0.0;
    double adjusted_score = 0.0;
    CorrelationDirection correlation_direction = CorrelationDirection::Positive;
    std::string correlation_explanation;
    std::string recommended_outcome;
    std::vector<std::string> risk_factors_addressed;

    nlohmann::json to_json() const;
};

struct HedgeBet {
    ScoredRecord market;
    std::string outcome;
    double allocation = 0.0;          // USD
    double allocation_percent = 0.0;  // 0-100
    double current_price = 0.0;
    double potential_payout = 0.0;
    double payout_multiplier = 1.0;

    nlohmann::json to_json() const;
};

// One mutually exclusive hedge strategy. Every bundle is sized against the full budget.
struct HedgeBundle {
    double budget = 0.0;
    std::vector<HedgeBet> bets;
    double total_allocated = 0.0;
    std::string coverage_summary;
    std::vector<std::string> risk_factors_covered;

    nlohmann::json to_json() const;
};

struct RiskFactor {
    std::string name;
    std::string description;
    std::string category;
    std::vector<std::string> keywords;
};

// Theme classification output
struct ThemeEntry {
    int index = 0;  // 1-based into the classified record list
    double correlation_score = 0.5;
    std::string explanation;
    std::string recommended_outcome;
};

struct Theme {
    std::string name;
    std::string description;
    std::vector<ThemeEntry> entries;

    static Theme from_json(const nlohmann::json& j);
};

struct BundleMetrics {
    std::string theme_name;
    double total_allocation = 0.0;
    int num_markets = 0;

    double avg_payout_multiplier = 1.0;
    double max_payout = 0.0;
    double min_payout = 0.0;
    double total_max_payout = 0.0;

    double risk_score = 0.0;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
    double expected_return = 0.0;

    double diversification_score = 0.0;
    double liquidity_score = 0.0;

    nlohmann::json to_json() const;
};

struct PortfolioMetrics {
    double total_budget = 0.0;
    double total_allocated = 0.0;
    int num_bundles = 0;
    int total_markets = 0;

    double overall_risk_score = 0.0;
    double portfolio_volatility = 0.0;
    double sharpe_ratio = 0.0;

    double correlation_score = 0.0;
    double sector_diversity_score = 0.0;

    double total_max_payout = 0.0;
    double weighted_avg_multiplier = 1.0;
    double expected_return = 0.0;

    std::vector<BundleMetrics> bundle_metrics;

    nlohmann::json to_json() const;
};
