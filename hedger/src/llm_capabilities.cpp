#include "llm_capabilities.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

std::string context_section(const std::string& context, const std::string& usage) {
    if (context.empty()) {
        return "";
    }
    return fmt::format("\nRECENT WEB CONTEXT:\n{}\n\n{}\n\n", context, usage);
}

void check_response(const cpr::Response& response, const std::string& what) {
    if (response.error) {
        throw CapabilityFailure(fmt::format("{} request failed: {}", what, response.error.message));
    }
    if (response.status_code != 200) {
        throw CapabilityFailure(fmt::format("{} request failed with status {}: {}",
                                            what, response.status_code, util::truncate(response.text, 200)));
    }
}

nlohmann::json organize_themes_tool() {
    nlohmann::json market_item = {
        {"type", "object"},
        {"properties", {
            {"index", {{"type", "integer"}}},
            {"correlation_score", {{"type", "number"}}},
            {"explanation", {{"type", "string"}}},
            {"recommended_outcome", {
                {"type", "string"},
                {"description", "The specific outcome to bet on (e.g. 'Yes', 'No', 'Trump'). "
                                "Must match one of the market's available outcomes."}
            }}
        }},
        {"required", {"index", "correlation_score", "explanation", "recommended_outcome"}}
    };

    nlohmann::json theme_item = {
        {"type", "object"},
        {"properties", {
            {"name", {{"type", "string"}}},
            {"description", {{"type", "string"}}},
            {"markets", {{"type", "array"}, {"items", market_item}}}
        }},
        {"required", {"name", "description", "markets"}}
    };

    return {
        {"name", "organize_themes"},
        {"description", "Organize markets into themed portfolios with correlation scores"},
        {"input_schema", {
            {"type", "object"},
            {"properties", {{"themes", {{"type", "array"}, {"items", theme_item}}}}},
            {"required", {"themes"}}
        }}
    };
}

} // namespace

class LlmRankingClient::Impl {
public:
    Impl(const Config& config, std::shared_ptr<RateLimiter> limiter)
        : url_(config.cerebras_api_url + "/chat/completions"),
          api_key_(config.cerebras_api_key),
          model_(config.ranking_model),
          timeout_ms_(config.capability_timeout_ms),
          limiter_(limiter ? std::move(limiter)
                           : std::make_shared<RateLimiter>(config.capability_requests_per_second)) {
        if (api_key_.empty()) {
            throw ConfigurationError("CEREBRAS_API_KEY is required for the ranking capability");
        }
        spdlog::info("Ranking capability using {} (model: {})", url_, model_);
    }

    std::vector<std::string> rank(const std::vector<MarketRecord>& batch,
                                  const std::string& concern,
                                  const std::string& context,
                                  size_t top_k) {
        spdlog::info("Ranking {} markets to top {}", batch.size(), top_k);

        nlohmann::json body = {
            {"model", model_},
            {"messages", nlohmann::json::array({
                {{"role", "system"}, {"content", "You are a financial analyst that outputs JSON."}},
                {{"role", "user"}, {"content", LlmRankingClient::build_prompt(batch, concern, context, top_k)}}
            })},
            {"response_format", {{"type", "json_object"}}},
            {"temperature", 0.0},
            {"max_completion_tokens", 2048}
        };

        limiter_->acquire("ranking");
        auto response = cpr::Post(
            cpr::Url{url_},
            cpr::Header{{"Authorization", "Bearer " + api_key_},
                        {"Content-Type", "application/json"},
                        {"User-Agent", "PolyHedge/1.0"}},
            cpr::Body{body.dump()},
            cpr::Timeout{timeout_ms_}
        );
        check_response(response, "Ranking");

        auto ids = LlmRankingClient::parse_response(response.text);
        spdlog::info("Ranking capability selected {} markets from batch", ids.size());
        return ids;
    }

private:
    std::string url_;
    std::string api_key_;
    std::string model_;
    int timeout_ms_;
    std::shared_ptr<RateLimiter> limiter_;
};

LlmRankingClient::LlmRankingClient(const Config& config, std::shared_ptr<RateLimiter> limiter)
    : pImpl_(std::make_unique<Impl>(config, std::move(limiter))) {}

LlmRankingClient::~LlmRankingClient() = default;

std::vector<std::string> LlmRankingClient::rank(const std::vector<MarketRecord>& batch,
                                                const std::string& concern,
                                                const std::string& context,
                                                size_t top_k) {
    return pImpl_->rank(batch, concern, context, top_k);
}

std::string LlmRankingClient::build_prompt(const std::vector<MarketRecord>& batch,
                                           const std::string& concern,
                                           const std::string& context,
                                           size_t top_k) {
    std::string markets_text;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (i > 0) markets_text += "\n\n";
        markets_text += fmt::format("{}. ID: {}\n   Question: {}\n   Liquidity: ${:.0f}",
                                    i + 1, batch[i].id, batch[i].question, batch[i].liquidity);
    }

    return fmt::format(
        "You are a financial risk analyst helping users find prediction markets to hedge their concerns.\n\n"
        "USER'S CONCERN:\n{}\n\n"
        "{}AVAILABLE MARKETS:\n{}\n\n"
        "TASK:\n"
        "Identify the top {} markets most relevant for hedging this concern. Consider:\n"
        "- Direct correlations (market outcome directly affects the concern)\n"
        "- Leading indicators (market predicts conditions that cause the concern)\n"
        "- Indirect hedges (market outcomes offset financial impact of the concern)\n\n"
        "Return a JSON object with:\n"
        "{{\n  \"top_market_ids\": [\"id1\", \"id2\", ...],\n"
        "  \"reasoning\": \"Brief explanation of selection strategy\"\n}}\n\n"
        "Only include market IDs from the list above. Order by relevance (most relevant first).",
        concern,
        context_section(context, "Use this context to better understand the user's concern and current events."),
        markets_text,
        top_k);
}

std::vector<std::string> LlmRankingClient::parse_response(const std::string& body) {
    try {
        auto data = nlohmann::json::parse(body);
        const auto& content = data.at("choices").at(0).at("message").at("content");
        auto parsed = nlohmann::json::parse(content.get<std::string>());

        std::vector<std::string> ids;
        if (parsed.contains("top_market_ids") && parsed["top_market_ids"].is_array()) {
            for (const auto& id : parsed["top_market_ids"]) {
                if (id.is_string()) {
                    ids.push_back(id.get<std::string>());
                } else if (id.is_number_integer()) {
                    ids.push_back(std::to_string(id.get<long long>()));
                }
            }
        }
        if (parsed.contains("reasoning") && parsed["reasoning"].is_string()) {
            spdlog::debug("Ranking reasoning: {}", parsed["reasoning"].get<std::string>());
        }
        return ids;
    } catch (const nlohmann::json::exception& e) {
        throw CapabilityFailure(std::string("Unexpected ranking response format: ") + e.what());
    }
}

class LlmThemeClient::Impl {
public:
    Impl(const Config& config, std::shared_ptr<RateLimiter> limiter)
        : url_(config.anthropic_api_url + "/messages"),
          api_key_(config.anthropic_api_key),
          model_(config.theme_model),
          max_tokens_(config.max_tokens),
          timeout_ms_(config.capability_timeout_ms),
          limiter_(limiter ? std::move(limiter)
                           : std::make_shared<RateLimiter>(config.capability_requests_per_second)) {
        if (api_key_.empty()) {
            throw ConfigurationError("ANTHROPIC_API_KEY is required for theme classification");
        }
        spdlog::info("Theme classifier using {} (model: {})", url_, model_);
    }

    std::vector<Theme> classify(const std::vector<MarketRecord>& records,
                                const std::string& concern,
                                const std::string& context) {
        spdlog::info("Identifying market themes for {} markets", records.size());

        nlohmann::json body = {
            {"model", model_},
            {"max_tokens", max_tokens_},
            {"messages", nlohmann::json::array({
                {{"role", "user"}, {"content", LlmThemeClient::build_prompt(records, concern, context)}}
            })},
            {"tools", nlohmann::json::array({organize_themes_tool()})}
        };

        limiter_->acquire("themes");
        auto response = cpr::Post(
            cpr::Url{url_},
            cpr::Header{{"x-api-key", api_key_},
                        {"anthropic-version", "2023-06-01"},
                        {"Content-Type", "application/json"}},
            cpr::Body{body.dump()},
            cpr::Timeout{timeout_ms_}
        );
        check_response(response, "Theme classification");

        auto themes = LlmThemeClient::parse_response(response.text);
        spdlog::info("Organized markets into {} themes", themes.size());
        return themes;
    }

private:
    std::string url_;
    std::string api_key_;
    std::string model_;
    int max_tokens_;
    int timeout_ms_;
    std::shared_ptr<RateLimiter> limiter_;
};

LlmThemeClient::LlmThemeClient(const Config& config, std::shared_ptr<RateLimiter> limiter)
    : pImpl_(std::make_unique<Impl>(config, std::move(limiter))) {}

LlmThemeClient::~LlmThemeClient() = default;

std::vector<Theme> LlmThemeClient::classify(const std::vector<MarketRecord>& records,
                                            const std::string& concern,
                                            const std::string& context) {
    return pImpl_->classify(records, concern, context);
}

std::string LlmThemeClient::build_prompt(const std::vector<MarketRecord>& records,
                                         const std::string& concern,
                                         const std::string& context) {
    std::string summary;
    for (size_t i = 0; i < records.size(); ++i) {
        summary += fmt::format("{}. {} (${:.0f} liquidity)\n", i + 1, records[i].question, records[i].liquidity);
    }

    return fmt::format(
        "You are organizing prediction markets into themed ETF-style portfolios for hedging.\n\n"
        "USER'S CONCERN:\n{}\n\n"
        "{}AVAILABLE MARKETS ({} total):\n{}\n"
        "TASK:\n"
        "Group these markets into 3-5 coherent themes that make sense as separate hedge portfolios.\n"
        "Each theme should contain 6-8 markets (or as many valid ones as possible).\n"
        "Each theme should represent a distinct hedging strategy or risk angle.\n\n"
        "For each market in a theme, assign a correlation_score (0.0-1.0) indicating how strongly "
        "that market correlates with the user's concern, a one-sentence explanation, and the "
        "recommended_outcome to bet on. Use the organize_themes tool to return the result.",
        concern,
        context_section(context, "Use this context to create relevant, timely themes."),
        records.size(),
        summary);
}

std::vector<Theme> LlmThemeClient::parse_response(const std::string& body) {
    try {
        auto data = nlohmann::json::parse(body);
        for (const auto& block : data.at("content")) {
            if (block.value("type", "") != "tool_use" || block.value("name", "") != "organize_themes") {
                continue;
            }
            std::vector<Theme> themes;
            for (const auto& item : block.at("input").at("themes")) {
                themes.push_back(Theme::from_json(item));
            }
            return themes;
        }
    } catch (const nlohmann::json::exception& e) {
        throw CapabilityFailure(std::string("Unexpected theme response format: ") + e.what());
    }
    throw CapabilityFailure("Theme response carried no organize_themes tool call");
}
