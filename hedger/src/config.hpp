#pragma once
#include <string>

// Heuristic tuning values used by the risk metrics engine
struct MetricsConstants {
    double portfolio_risk_weight = 0.7;
    double individual_risk_weight = 0.3;
    double risk_std_scale = 400.0;
    double diversification_scale = 400.0;
    double risk_free_rate = 0.05;
    double liquidity_reference = 100000.0;
    double correlation_step = 0.2;
    double sector_target = 5.0;
};

class Config {
public:
    // Service info
    std::string service_name = "hedger";
    std::string log_level = "info";

    // Storage
    std::string db_path = "polyhedge.db";
    std::string vector_db_path = "polyhedge_vectors.db";

    // Source feed
    std::string gamma_api_url = "https://gamma-api.polymarket.com";
    int feed_page_size = 500;
    int feed_max_markets = 50000;
    int http_timeout_ms = 30000;
    int feed_max_retries = 3;
    double base_backoff_seconds = 1.0;
    double max_backoff_seconds = 60.0;

    // Embeddings (empty URL selects the local hashing embedder)
    std::string embedding_api_url;
    std::string embedding_api_key;
    std::string embedding_model = "all-MiniLM-L6-v2";
    int embedding_dimension = 384;
    int index_batch_size = 100;

    // Ranking capability (OpenAI-compatible chat completions)
    std::string cerebras_api_url = "https://api.cerebras.ai/v1";
    std::string cerebras_api_key;
    std::string ranking_model = "llama-3.3-70b";

    // Theme classification capability (Anthropic messages)
    std::string anthropic_api_url = "https://api.anthropic.com/v1";
    std::string anthropic_api_key;
    std::string theme_model = "claude-sonnet-4-5-20250929";
    int max_tokens = 4096;

    int capability_timeout_ms = 30000;
    int capability_requests_per_second = 2;

    // Hedge settings
    double default_budget = 100.0;
    int max_markets_in_bundle = 8;
    int search_results = 500;
    double min_liquidity = 100.0;
    int filter_batch_size = 100;
    int filter_top_k = 10;

    MetricsConstants metrics;

    // HTTP server
    std::string http_host = "0.0.0.0";
    int http_port = 8080;

    static Config from_env();
    void validate() const;
};
