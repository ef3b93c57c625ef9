#include "types.hpp"
#include "errors.hpp"

using json = nlohmann::json;

json Outcome::to_json() const {
    return json{{"name", name}, {"price", price}};
}

Outcome Outcome::from_json(const json& j) {
    Outcome outcome;
    outcome.name = j.at("name").get<std::string>();
    outcome.price = j.at("price").get<double>();
    return outcome;
}

std::optional<std::string> MarketRecord::url() const {
    if (slug && !slug->empty()) {
        return "https://polymarket.com/event/" + *slug;
    }
    return std::nullopt;
}

json MarketRecord::to_json() const {
    json j;
    j["id"] = id;
    j["question"] = question;
    j["description"] = description;
    j["outcomes"] = json::array();
    for (const auto& outcome : outcomes) {
        j["outcomes"].push_back(outcome.to_json());
    }
    j["liquidity"] = liquidity;
    j["volume"] = volume;
    j["end_date"] = end_date ? json(*end_date) : json(nullptr);
    j["active"] = active;
    j["slug"] = slug ? json(*slug) : json(nullptr);
    return j;
}

MarketRecord MarketRecord::from_json(const json& j) {
    try {
        MarketRecord record;
        record.id = j.at("id").get<std::string>();
        record.question = j.at("question").get<std::string>();
        record.description = j.value("description", "");
        if (j.contains("outcomes") && j["outcomes"].is_array()) {
            for (const auto& item : j["outcomes"]) {
                record.outcomes.push_back(Outcome::from_json(item));
            }
        }
        record.liquidity = j.value("liquidity", 0.0);
        record.volume = j.value("volume", 0.0);
        if (j.contains("end_date") && j["end_date"].is_string()) {
            record.end_date = j["end_date"].get<std::string>();
        }
        record.active = j.value("active", true);
        if (j.contains("slug") && j["slug"].is_string()) {
            record.slug = j["slug"].get<std::string>();
        }
        return record;
    } catch (const json::exception& e) {
        throw DeserializationError(std::string("Malformed market record: ") + e.what());
    }
}

std::string to_string(CorrelationDirection direction) {
    return direction == CorrelationDirection::Positive ? "positive" : "negative";
}

CorrelationDirection correlation_direction_from_string(const std::string& value) {
    return value == "negative" ? CorrelationDirection::Negative : CorrelationDirection::Positive;
}

json ScoredRecord::to_json() const {
    json j;
    j["market"] = record.to_json();
    j["market"]["url"] = record.url() ? json(*record.url()) : json(nullptr);
    j["relevance_score"] = relevance_score;
    j["adjusted_score"] = adjusted_score;
    j["correlation_direction"] = to_string(correlation_direction);
    j["correlation_explanation"] = correlation_explanation;
    j["recommended_outcome"] = recommended_outcome;
    j["risk_factors_addressed"] = risk_factors_addressed;
    return j;
}

json HedgeBet::to_json() const {
    json j;
    j["market"] = market.to_json();
    j["outcome"] = outcome;
    j["allocation"] = allocation;
    j["allocation_percent"] = allocation_percent;
    j["current_price"] = current_price;
    j["potential_payout"] = potential_payout;
    j["payout_multiplier"] = payout_multiplier;
    return j;
}

json HedgeBundle::to_json() const {
    json j;
    j["budget"] = budget;
    j["bets"] = json::array();
    for (const auto& bet : bets) {
        j["bets"].push_back(bet.to_json());
    }
    j["total_allocated"] = total_allocated;
    j["coverage_summary"] = coverage_summary;
    j["risk_factors_covered"] = risk_factors_covered;
    return j;
}

Theme Theme::from_json(const json& j) {
    Theme theme;
    theme.name = j.at("name").get<std::string>();
    theme.description = j.value("description", "");
    if (j.contains("markets") && j["markets"].is_array()) {
        for (const auto& item : j["markets"]) {
            ThemeEntry entry;
            entry.index = item.at("index").get<int>();
            entry.correlation_score = item.value("correlation_score", 0.5);
            entry.explanation = item.value("explanation", "");
            entry.recommended_outcome = item.value("recommended_outcome", "");
            theme.entries.push_back(entry);
        }
    }
    return theme;
}

json BundleMetrics::to_json() const {
    json j;
    j["theme_name"] = theme_name;
    j["total_allocation"] = total_allocation;
    j["num_markets"] = num_markets;
    j["avg_payout_multiplier"] = avg_payout_multiplier;
    j["max_payout"] = max_payout;
    j["min_payout"] = min_payout;
    j["total_max_payout"] = total_max_payout;
    j["risk_score"] = risk_score;
    j["volatility"] = volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["expected_return"] = expected_return;
    j["diversification_score"] = diversification_score;
    j["liquidity_score"] = liquidity_score;
    return j;
}

json PortfolioMetrics::to_json() const {
    json j;
    j["total_budget"] = total_budget;
    j["total_allocated"] = total_allocated;
    j["num_bundles"] = num_bundles;
    j["total_markets"] = total_markets;
    j["overall_risk_score"] = overall_risk_score;
    j["portfolio_volatility"] = portfolio_volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["correlation_score"] = correlation_score;
    j["sector_diversity_score"] = sector_diversity_score;
    j["total_max_payout"] = total_max_payout;
    j["weighted_avg_multiplier"] = weighted_avg_multiplier;
    j["expected_return"] = expected_return;
    j["bundle_metrics"] = json::array();
    for (const auto& metrics : bundle_metrics) {
        j["bundle_metrics"].push_back(metrics.to_json());
    }
    return j;
}
