#pragma once
#include "capabilities.hpp"
#include "config.hpp"
#include "rate_limiter.hpp"
#include <memory>
#include <string>
#include <vector>

// Ranking over an OpenAI-compatible chat completions endpoint (Cerebras)
class LlmRankingClient : public RankingCapability {
public:
    // Throws ConfigurationError when no API key is configured
    LlmRankingClient(const Config& config, std::shared_ptr<RateLimiter> limiter = nullptr);
    ~LlmRankingClient() override;

    std::vector<std::string> rank(const std::vector<MarketRecord>& batch,
                                  const std::string& concern,
                                  const std::string& context,
                                  size_t top_k) override;

    static std::string build_prompt(const std::vector<MarketRecord>& batch,
                                    const std::string& concern,
                                    const std::string& context,
                                    size_t top_k);

    // Extracts top_market_ids from a chat completion body. Throws CapabilityFailure.
    static std::vector<std::string> parse_response(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Theme classification over the Anthropic messages API using the organize_themes tool
class LlmThemeClient : public ThemeClassifier {
public:
    // Throws ConfigurationError when no API key is configured
    LlmThemeClient(const Config& config, std::shared_ptr<RateLimiter> limiter = nullptr);
    ~LlmThemeClient() override;

    std::vector<Theme> classify(const std::vector<MarketRecord>& records,
                                const std::string& concern,
                                const std::string& context) override;

    static std::string build_prompt(const std::vector<MarketRecord>& records,
                                    const std::string& concern,
                                    const std::string& context);

    // Reads the organize_themes tool input from a messages body. Throws CapabilityFailure.
    static std::vector<Theme> parse_response(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
