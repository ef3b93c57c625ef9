#include <gtest/gtest.h>
#include "outcome_resolver.hpp"
#include "test_helpers.hpp"

using test_helpers::make_record;
using Tier = OutcomeResolver::Tier;

class OutcomeResolverTest : public ::testing::Test {
protected:
    MarketRecord election_ = make_record("e1", "Who wins the election?", 1000.0,
                                         {{"Donald Trump", 0.55}, {"Kamala Harris", 0.40}, {"Other", 0.05}});
};

TEST_F(OutcomeResolverTest, ExactMatchIgnoresCase) {
    auto r = OutcomeResolver::resolve(election_, "kamala harris");
    EXPECT_EQ(r.tier, Tier::ExactMatch);
    ASSERT_TRUE(r.resolved());
    EXPECT_EQ(r.outcome->name, "Kamala Harris");
    EXPECT_DOUBLE_EQ(r.outcome->price, 0.40);
}

TEST_F(OutcomeResolverTest, SubstringMatchesEitherDirection) {
    auto shorter = OutcomeResolver::resolve(election_, "Trump");
    EXPECT_EQ(shorter.tier, Tier::SubstringMatch);
    EXPECT_EQ(shorter.outcome->name, "Donald Trump");

    auto longer = OutcomeResolver::resolve(election_, "Other candidate");
    EXPECT_EQ(longer.tier, Tier::SubstringMatch);
    EXPECT_EQ(longer.outcome->name, "Other");
}

TEST_F(OutcomeResolverTest, UnknownLabelFallsBackToCheapest) {
    auto r = OutcomeResolver::resolve(election_, "Nobody");
    EXPECT_EQ(r.tier, Tier::CheapestFallback);
    EXPECT_EQ(r.outcome->name, "Other");
}

TEST_F(OutcomeResolverTest, EmptyLabelSkipsToFallback) {
    auto r = OutcomeResolver::resolve(election_, "  ");
    EXPECT_EQ(r.tier, Tier::CheapestFallback);
    EXPECT_DOUBLE_EQ(r.outcome->price, 0.05);
}

TEST_F(OutcomeResolverTest, RecordWithoutOutcomesIsUnresolved) {
    auto bare = make_record("b1", "No prices yet", 1000.0, {});
    auto r = OutcomeResolver::resolve(bare, "Yes");
    EXPECT_EQ(r.tier, Tier::Unresolved);
    EXPECT_FALSE(r.resolved());
    EXPECT_EQ(OutcomeResolver::tier_name(r.tier), "unresolved");
}
