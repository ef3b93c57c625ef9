#include <gtest/gtest.h>
#include "llm_capabilities.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using test_helpers::make_record;

namespace {

std::string chat_completion(const std::string& content) {
    json body = {
        {"id", "chatcmpl-1"},
        {"choices", json::array({
            json{{"index", 0}, {"message", {{"role", "assistant"}, {"content", content}}}}
        })}
    };
    return body.dump();
}

} // namespace

TEST(LlmRankingClientTest, MissingKeyIsConfigurationError) {
    Config config;
    config.cerebras_api_key = "";
    EXPECT_THROW(LlmRankingClient client(config), ConfigurationError);
}

TEST(LlmRankingClientTest, ParsesTopMarketIds) {
    auto ids = LlmRankingClient::parse_response(
        chat_completion(R"({"top_market_ids": ["m3", 17, "m1"], "reasoning": "rates first"})"));

    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], "m3");
    EXPECT_EQ(ids[1], "17");
    EXPECT_EQ(ids[2], "m1");
}

TEST(LlmRankingClientTest, MissingIdListGivesEmptyRanking) {
    EXPECT_TRUE(LlmRankingClient::parse_response(chat_completion(R"({"reasoning": "none fit"})")).empty());
}

TEST(LlmRankingClientTest, MalformedBodiesAreCapabilityFailures) {
    EXPECT_THROW(LlmRankingClient::parse_response("not json"), CapabilityFailure);
    EXPECT_THROW(LlmRankingClient::parse_response(R"({"choices": []})"), CapabilityFailure);
    EXPECT_THROW(LlmRankingClient::parse_response(chat_completion("plain prose")), CapabilityFailure);
}

TEST(LlmRankingClientTest, PromptListsEveryCandidate) {
    auto prompt = LlmRankingClient::build_prompt(
        {make_record("fed-1", "Will the Fed cut?", 12345.0), make_record("oil-2", "Brent above 90?")},
        "mortgage payments rising", "", 5);

    EXPECT_NE(prompt.find("mortgage payments rising"), std::string::npos);
    EXPECT_NE(prompt.find("1. ID: fed-1"), std::string::npos);
    EXPECT_NE(prompt.find("2. ID: oil-2"), std::string::npos);
    EXPECT_NE(prompt.find("Liquidity: $12345"), std::string::npos);
    EXPECT_NE(prompt.find("top 5 markets"), std::string::npos);
    EXPECT_EQ(prompt.find("RECENT WEB CONTEXT"), std::string::npos);

    auto with_context = LlmRankingClient::build_prompt({}, "concern", "Rates rose 50bp today", 5);
    EXPECT_NE(with_context.find("RECENT WEB CONTEXT:\nRates rose 50bp today"), std::string::npos);
}

TEST(LlmThemeClientTest, MissingKeyIsConfigurationError) {
    Config config;
    config.anthropic_api_key = "";
    EXPECT_THROW(LlmThemeClient client(config), ConfigurationError);
}

TEST(LlmThemeClientTest, ParsesToolUseBlock) {
    json body = {
        {"content", json::array({
            json{{"type", "text"}, {"text", "Here are the themes."}},
            json{{"type", "tool_use"}, {"name", "organize_themes"}, {"input", {
                {"themes", json::array({
                    json{{"name", "Rates"}, {"description", "Monetary policy"}, {"markets", json::array({
                        json{{"index", 2}, {"correlation_score", 0.8}, {"explanation", "direct"},
                             {"recommended_outcome", "Yes"}},
                        json{{"index", 1}}
                    })}},
                    json{{"name", "Energy"}, {"markets", json::array()}}
                })}
            }}}
        })}
    };

    auto themes = LlmThemeClient::parse_response(body.dump());

    ASSERT_EQ(themes.size(), 2u);
    EXPECT_EQ(themes[0].name, "Rates");
    EXPECT_EQ(themes[0].description, "Monetary policy");
    ASSERT_EQ(themes[0].entries.size(), 2u);
    EXPECT_EQ(themes[0].entries[0].index, 2);
    EXPECT_DOUBLE_EQ(themes[0].entries[0].correlation_score, 0.8);
    EXPECT_EQ(themes[0].entries[0].recommended_outcome, "Yes");
    EXPECT_DOUBLE_EQ(themes[0].entries[1].correlation_score, 0.5);
    EXPECT_TRUE(themes[0].entries[1].recommended_outcome.empty());
    EXPECT_EQ(themes[1].name, "Energy");
    EXPECT_TRUE(themes[1].entries.empty());
}

TEST(LlmThemeClientTest, ResponsesWithoutToolCallFail) {
    json text_only = {{"content", json::array({json{{"type", "text"}, {"text", "I cannot help"}}})}};
    EXPECT_THROW(LlmThemeClient::parse_response(text_only.dump()), CapabilityFailure);
    EXPECT_THROW(LlmThemeClient::parse_response("{"), CapabilityFailure);

    json missing_index = {{"content", json::array({
        json{{"type", "tool_use"}, {"name", "organize_themes"}, {"input", {
            {"themes", json::array({json{{"name", "Broken"}, {"markets", json::array({json{{"explanation", "?"}}})}}})}
        }}}
    })}};
    EXPECT_THROW(LlmThemeClient::parse_response(missing_index.dump()), CapabilityFailure);
}

TEST(LlmThemeClientTest, PromptNumbersRecordsFromOne) {
    auto prompt = LlmThemeClient::build_prompt(
        {make_record("a", "Fed cuts in June", 2500.0), make_record("b", "Brent above 90", 900.0)},
        "job security", "");

    EXPECT_NE(prompt.find("AVAILABLE MARKETS (2 total)"), std::string::npos);
    EXPECT_NE(prompt.find("1. Fed cuts in June ($2500 liquidity)"), std::string::npos);
    EXPECT_NE(prompt.find("2. Brent above 90 ($900 liquidity)"), std::string::npos);
}
