#include "portfolio_builder.hpp"
#include "outcome_resolver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

PortfolioBuilder::PortfolioBuilder(ThemeClassifier& classifier, PortfolioBuilderSettings settings)
    : classifier_(classifier), settings_(settings) {
    spdlog::debug("PortfolioBuilder initialized (max_markets={})", settings_.max_markets_in_bundle);
}

HedgeBundle PortfolioBuilder::build_bundle(const std::vector<ScoredRecord>& scored,
                                           double budget,
                                           const std::vector<RiskFactor>& risk_factors) {
    spdlog::info("Generating bundle from {} scored markets with ${} budget", scored.size(), budget);

    auto selected = select_diverse(scored, settings_.max_markets_in_bundle);
    spdlog::info("Selected {} diverse markets for bundle", selected.size());

    HedgeBundle bundle;
    bundle.budget = budget;

    if (selected.empty()) {
        spdlog::warn("No suitable markets found for hedging");
        bundle.coverage_summary = "No suitable markets found for hedging.";
        return bundle;
    }

    bundle.bets = allocate_budget(selected, budget);
    bundle.risk_factors_covered = covered_factors(selected, risk_factors);
    bundle.coverage_summary = coverage_summary(bundle.bets, bundle.risk_factors_covered);
    for (const auto& bet : bundle.bets) {
        bundle.total_allocated += bet.allocation;
    }

    spdlog::info("Bundle complete: {} bets, ${:.2f} allocated, {} risk factors covered",
                 bundle.bets.size(), bundle.total_allocated, bundle.risk_factors_covered.size());
    return bundle;
}

std::vector<ScoredRecord> PortfolioBuilder::select_diverse(const std::vector<ScoredRecord>& scored,
                                                           size_t max_count) const {
    if (scored.empty() || max_count == 0) {
        return {};
    }

    std::vector<ScoredRecord> candidates;
    for (const auto& sr : scored) {
        if (sr.adjusted_score >= settings_.min_adjusted_score) {
            candidates.push_back(sr);
        }
    }
    spdlog::debug("Found {} candidates with score >= {}", candidates.size(), settings_.min_adjusted_score);

    if (candidates.empty()) {
        size_t n = std::min(max_count, scored.size());
        candidates.assign(scored.begin(), scored.begin() + n);
        spdlog::debug("No candidates met threshold, using top {} markets", candidates.size());
    }

    std::vector<ScoredRecord> selected;
    std::unordered_set<std::string> seen_words;

    for (const auto& sr : candidates) {
        if (selected.size() >= max_count) {
            break;
        }

        auto words = util::word_set(sr.record.question);
        size_t shared = 0;
        for (const auto& w : words) {
            if (seen_words.count(w)) ++shared;
        }
        double overlap = static_cast<double>(shared) / static_cast<double>(std::max<size_t>(words.size(), 1));

        if (overlap < settings_.max_overlap) {
            selected.push_back(sr);
            seen_words.insert(words.begin(), words.end());
            spdlog::debug("Selected: {} (score={:.3f})", util::truncate(sr.record.question, 60), sr.adjusted_score);
        } else {
            spdlog::debug("Skipped (too similar, {:.0f}% overlap): {}", overlap * 100,
                          util::truncate(sr.record.question, 40));
        }
    }

    return selected;
}

std::vector<HedgeBet> PortfolioBuilder::allocate_budget(const std::vector<ScoredRecord>& selected,
                                                        double budget) const {
    std::vector<HedgeBet> bets;
    if (selected.empty()) {
        return bets;
    }

    double total_score = 0.0;
    for (const auto& sr : selected) {
        total_score += sr.adjusted_score;
    }

    bets.reserve(selected.size());
    for (const auto& sr : selected) {
        double weight = total_score > 0.0
            ? sr.adjusted_score / total_score
            : 1.0 / static_cast<double>(selected.size());
        double allocation = budget * weight;

        auto resolution = OutcomeResolver::resolve(sr.record, sr.recommended_outcome);
        double price = resolution.resolved() ? resolution.outcome->price : 0.5;
        double multiplier = price > 0.0 ? 1.0 / price : 1.0;

        HedgeBet bet;
        bet.market = sr;
        bet.outcome = resolution.resolved() ? resolution.outcome->name : sr.recommended_outcome;
        bet.allocation = util::round_cents(allocation);
        bet.allocation_percent = util::round_to(weight * 100.0, 1);
        bet.current_price = price;
        bet.potential_payout = util::round_cents(allocation * multiplier);
        bet.payout_multiplier = util::round_cents(multiplier);
        bets.push_back(std::move(bet));
    }

    spdlog::debug("Allocated budget across {} bets", bets.size());
    return bets;
}

void PortfolioBuilder::apply_score_heuristics(std::vector<ScoredRecord>& scored) {
    for (auto& sr : scored) {
        double adjusted = sr.relevance_score;
        const auto& record = sr.record;

        if (record.liquidity > 100000) {
            adjusted *= 1.15;
        } else if (record.liquidity > 50000) {
            adjusted *= 1.10;
        } else if (record.liquidity > 10000) {
            adjusted *= 1.05;
        } else if (record.liquidity < 1000) {
            adjusted *= 0.8;
        }

        auto resolution = OutcomeResolver::resolve(record, sr.recommended_outcome);
        if (resolution.tier == OutcomeResolver::Tier::ExactMatch) {
            double price = resolution.outcome->price;
            if (price > 0.9 || price < 0.1) {
                adjusted *= 0.7;
            } else if (price > 0.8 || price < 0.2) {
                adjusted *= 0.85;
            }
        }

        if (record.volume > 1000000) {
            adjusted *= 1.10;
        } else if (record.volume > 100000) {
            adjusted *= 1.05;
        }

        sr.adjusted_score = std::min(adjusted, 1.0);
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const ScoredRecord& a, const ScoredRecord& b) {
            return a.adjusted_score > b.adjusted_score;
        });
}

std::vector<HedgeBundle> PortfolioBuilder::build_themed_bundles(const std::vector<MarketRecord>& records,
                                                                const std::string& concern,
                                                                double budget,
                                                                const std::string& context) {
    spdlog::info("Generating themed bundles from {} markets, budget=${}", records.size(), budget);

    if (records.empty()) {
        spdlog::warn("No markets provided for themed bundle generation");
        HedgeBundle empty;
        empty.budget = budget;
        empty.coverage_summary = "No markets available for hedging.";
        return {empty};
    }

    auto themes = identify_themes(records, concern, context);
    spdlog::info("Identified {} themes", themes.size());

    std::vector<HedgeBundle> bundles;
    bundles.reserve(themes.size());
    for (const auto& theme : themes) {
        bundles.push_back(build_theme_bundle(theme, records, budget));
        spdlog::debug("Created bundle for theme: {}", theme.name);
    }
    return bundles;
}

std::vector<Theme> PortfolioBuilder::identify_themes(const std::vector<MarketRecord>& records,
                                                     const std::string& concern,
                                                     const std::string& context) {
    try {
        auto themes = classifier_.classify(records, concern, context);

        int n = static_cast<int>(records.size());
        for (auto& theme : themes) {
            auto& entries = theme.entries;
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                [n](const ThemeEntry& e) { return e.index < 1 || e.index > n; }),
                entries.end());
            // correlation weights must stay in [0, 1]
            for (auto& e : entries) {
                if (!std::isfinite(e.correlation_score)) {
                    e.correlation_score = 0.0;
                }
                e.correlation_score = std::clamp(e.correlation_score, 0.0, 1.0);
            }
        }

        for (size_t i = 0; i < themes.size(); ++i) {
            spdlog::info("=== Theme {}: {} === ({} markets)", i + 1, themes[i].name, themes[i].entries.size());
            for (const auto& entry : themes[i].entries) {
                spdlog::debug("    (corr={:.2f}) {}", entry.correlation_score,
                              util::truncate(records[entry.index - 1].question, 60));
            }
        }
        return themes;
    } catch (const std::exception& e) {
        spdlog::error("Theme classification failed: {}", e.what());
    }

    spdlog::warn("Falling back to single theme with all markets");
    Theme fallback;
    fallback.name = "Primary Hedge";
    fallback.description = "All relevant markets";
    for (size_t i = 0; i < records.size(); ++i) {
        ThemeEntry entry;
        entry.index = static_cast<int>(i) + 1;
        entry.correlation_score = 0.5;
        fallback.entries.push_back(entry);
    }
    return {fallback};
}

HedgeBundle PortfolioBuilder::build_theme_bundle(const Theme& theme,
                                                 const std::vector<MarketRecord>& records,
                                                 double budget) const {
    HedgeBundle bundle;
    bundle.budget = budget;

    if (theme.entries.empty()) {
        bundle.coverage_summary = fmt::format("{}: No markets in theme", theme.name);
        return bundle;
    }

    double total_correlation = 0.0;
    for (const auto& entry : theme.entries) {
        total_correlation += entry.correlation_score;
    }

    for (const auto& entry : theme.entries) {
        const auto& record = records[entry.index - 1];
        double weight = total_correlation > 0.0
            ? entry.correlation_score / total_correlation
            : 1.0 / static_cast<double>(theme.entries.size());
        double allocation = budget * weight;

        auto resolution = OutcomeResolver::resolve(record, entry.recommended_outcome);
        if (!resolution.resolved()) {
            spdlog::debug("Dropping {} from theme {}: no outcomes", record.id, theme.name);
            continue;
        }
        const Outcome& outcome = *resolution.outcome;
        double multiplier = outcome.price > 0.0 ? 1.0 / outcome.price : 1.0;

        HedgeBet bet;
        bet.market.record = record;
        bet.market.relevance_score = entry.correlation_score;
        bet.market.adjusted_score = entry.correlation_score;
        bet.market.correlation_direction = CorrelationDirection::Positive;
        bet.market.correlation_explanation = entry.explanation.empty() ? theme.description : entry.explanation;
        bet.market.recommended_outcome = outcome.name;
        bet.outcome = outcome.name;
        bet.allocation = util::round_cents(allocation);
        bet.allocation_percent = util::round_to(weight * 100.0, 1);
        bet.current_price = outcome.price;
        bet.potential_payout = util::round_cents(allocation * multiplier);
        bet.payout_multiplier = util::round_cents(multiplier);

        bundle.total_allocated += bet.allocation;
        bundle.bets.push_back(std::move(bet));
    }

    bundle.coverage_summary = fmt::format("{}: {}", theme.name, theme.description);
    return bundle;
}

std::vector<std::string> PortfolioBuilder::covered_factors(const std::vector<ScoredRecord>& selected,
                                                           const std::vector<RiskFactor>& risk_factors) {
    std::vector<std::string> covered;
    auto add = [&covered](const std::string& name) {
        if (std::find(covered.begin(), covered.end(), name) == covered.end()) {
            covered.push_back(name);
        }
    };

    for (const auto& sr : selected) {
        std::string text = sr.correlation_explanation + " " + sr.record.question;
        for (const auto& factor : risk_factors) {
            bool matched = util::contains_ci(text, factor.name);
            for (const auto& keyword : factor.keywords) {
                if (matched) break;
                matched = !keyword.empty() && util::contains_ci(text, keyword);
            }
            if (matched) {
                add(factor.name);
            }
        }
    }
    return covered;
}

std::string PortfolioBuilder::coverage_summary(const std::vector<HedgeBet>& bets,
                                               const std::vector<std::string>& factors) {
    std::vector<std::string> parts;
    parts.push_back(fmt::format("Hedge bundle with {} market(s):", bets.size()));

    if (!factors.empty()) {
        parts.push_back("Covers risk factors: " + join(factors, ", "));
    }

    double total_payout = 0.0;
    double total_allocation = 0.0;
    for (const auto& bet : bets) {
        total_payout += bet.potential_payout;
        total_allocation += bet.allocation;
    }
    double avg_multiplier = total_allocation > 0.0 ? total_payout / total_allocation : 1.0;
    parts.push_back(fmt::format("Average payout multiplier: {:.1f}x", avg_multiplier));

    return join(parts, " ");
}
