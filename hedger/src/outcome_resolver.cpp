#include "outcome_resolver.hpp"
#include "util.hpp"
#include <algorithm>

OutcomeResolver::Resolution OutcomeResolver::resolve(const MarketRecord& record, const std::string& label) {
    Resolution resolution;
    if (record.outcomes.empty()) {
        return resolution;
    }

    std::string wanted = util::trim(label);
    if (!wanted.empty()) {
        if (auto outcome = exact_match(record, wanted)) {
            resolution.tier = Tier::ExactMatch;
            resolution.outcome = outcome;
            return resolution;
        }
        if (auto outcome = substring_match(record, wanted)) {
            resolution.tier = Tier::SubstringMatch;
            resolution.outcome = outcome;
            return resolution;
        }
    }

    resolution.tier = Tier::CheapestFallback;
    resolution.outcome = cheapest(record);
    return resolution;
}

std::string OutcomeResolver::tier_name(Tier tier) {
    switch (tier) {
        case Tier::ExactMatch: return "exact";
        case Tier::SubstringMatch: return "substring";
        case Tier::CheapestFallback: return "cheapest";
        case Tier::Unresolved: return "unresolved";
    }
    return "unresolved";
}

std::optional<Outcome> OutcomeResolver::exact_match(const MarketRecord& record, const std::string& label) {
    std::string wanted = util::to_lower(label);
    for (const auto& outcome : record.outcomes) {
        if (util::to_lower(outcome.name) == wanted) {
            return outcome;
        }
    }
    return std::nullopt;
}

std::optional<Outcome> OutcomeResolver::substring_match(const MarketRecord& record, const std::string& label) {
    std::string wanted = util::to_lower(label);
    for (const auto& outcome : record.outcomes) {
        std::string name = util::to_lower(outcome.name);
        if (name.empty()) {
            continue;
        }
        if (name.find(wanted) != std::string::npos || wanted.find(name) != std::string::npos) {
            return outcome;
        }
    }
    return std::nullopt;
}

std::optional<Outcome> OutcomeResolver::cheapest(const MarketRecord& record) {
    auto it = std::min_element(record.outcomes.begin(), record.outcomes.end(),
        [](const Outcome& a, const Outcome& b) {
            return a.price < b.price;
        });
    if (it == record.outcomes.end()) {
        return std::nullopt;
    }
    return *it;
}
