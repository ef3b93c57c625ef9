#pragma once
#include "types.hpp"
#include <string>
#include <optional>

// Maps a free-text outcome label onto one of a record's outcomes.
// Tiers are tried in order: exact name, substring either way, cheapest outcome.
class OutcomeResolver {
public:
    enum class Tier {
        ExactMatch,
        SubstringMatch,
        CheapestFallback,
        Unresolved
    };

    struct Resolution {
        Tier tier = Tier::Unresolved;
        std::optional<Outcome> outcome;

        bool resolved() const { return outcome.has_value(); }
    };

    static Resolution resolve(const MarketRecord& record, const std::string& label);

    static std::string tier_name(Tier tier);

private:
    static std::optional<Outcome> exact_match(const MarketRecord& record, const std::string& label);
    static std::optional<Outcome> substring_match(const MarketRecord& record, const std::string& label);
    static std::optional<Outcome> cheapest(const MarketRecord& record);
};
