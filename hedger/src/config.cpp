#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;
using util::get_env_double;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "hedger");
    config.log_level = get_env_var("LOG_LEVEL", "info");

    // Storage
    config.db_path = get_env_var("DB_PATH", config.db_path);
    config.vector_db_path = get_env_var("VECTOR_DB_PATH", config.vector_db_path);

    // Source feed
    config.gamma_api_url = get_env_var("GAMMA_API_URL", config.gamma_api_url);
    config.feed_page_size = get_env_int("FEED_PAGE_SIZE", config.feed_page_size);
    config.feed_max_markets = get_env_int("FEED_MAX_MARKETS", config.feed_max_markets);
    config.http_timeout_ms = get_env_int("HTTP_TIMEOUT_MS", config.http_timeout_ms);
    config.feed_max_retries = get_env_int("FEED_MAX_RETRIES", config.feed_max_retries);
    config.base_backoff_seconds = get_env_double("BASE_BACKOFF_SECONDS", config.base_backoff_seconds);
    config.max_backoff_seconds = get_env_double("MAX_BACKOFF_SECONDS", config.max_backoff_seconds);

    // Embeddings
    config.embedding_api_url = get_env_var("EMBEDDING_API_URL");
    config.embedding_api_key = get_env_var("EMBEDDING_API_KEY");
    config.embedding_model = get_env_var("EMBEDDING_MODEL", config.embedding_model);
    config.embedding_dimension = get_env_int("EMBEDDING_DIMENSION", config.embedding_dimension);
    config.index_batch_size = get_env_int("INDEX_BATCH_SIZE", config.index_batch_size);

    // Capabilities
    config.cerebras_api_url = get_env_var("CEREBRAS_API_URL", config.cerebras_api_url);
    config.cerebras_api_key = get_env_var("CEREBRAS_API_KEY");
    config.ranking_model = get_env_var("RANKING_MODEL", config.ranking_model);
    config.anthropic_api_url = get_env_var("ANTHROPIC_API_URL", config.anthropic_api_url);
    config.anthropic_api_key = get_env_var("ANTHROPIC_API_KEY");
    config.theme_model = get_env_var("THEME_MODEL", config.theme_model);
    config.max_tokens = get_env_int("MAX_TOKENS", config.max_tokens);
    config.capability_timeout_ms = get_env_int("CAPABILITY_TIMEOUT_MS", config.capability_timeout_ms);
    config.capability_requests_per_second =
        get_env_int("CAPABILITY_REQUESTS_PER_SECOND", config.capability_requests_per_second);

    // Hedge settings
    config.default_budget = get_env_double("DEFAULT_BUDGET", config.default_budget);
    config.max_markets_in_bundle = get_env_int("MAX_MARKETS_IN_BUNDLE", config.max_markets_in_bundle);
    config.search_results = get_env_int("SEARCH_RESULTS", config.search_results);
    config.min_liquidity = get_env_double("MIN_LIQUIDITY", config.min_liquidity);
    config.filter_batch_size = get_env_int("FILTER_BATCH_SIZE", config.filter_batch_size);
    config.filter_top_k = get_env_int("FILTER_TOP_K", config.filter_top_k);

    // Metric heuristics
    auto& m = config.metrics;
    m.portfolio_risk_weight = get_env_double("RISK_PORTFOLIO_WEIGHT", m.portfolio_risk_weight);
    m.individual_risk_weight = get_env_double("RISK_INDIVIDUAL_WEIGHT", m.individual_risk_weight);
    m.risk_std_scale = get_env_double("RISK_STD_SCALE", m.risk_std_scale);
    m.diversification_scale = get_env_double("DIVERSIFICATION_SCALE", m.diversification_scale);
    m.risk_free_rate = get_env_double("RISK_FREE_RATE", m.risk_free_rate);
    m.liquidity_reference = get_env_double("LIQUIDITY_REFERENCE", m.liquidity_reference);
    m.correlation_step = get_env_double("CORRELATION_STEP", m.correlation_step);
    m.sector_target = get_env_double("SECTOR_TARGET", m.sector_target);

    // HTTP server
    config.http_host = get_env_var("HTTP_HOST", config.http_host);
    config.http_port = get_env_int("HTTP_PORT", config.http_port);

    return config;
}

void Config::validate() const {
    if (db_path.empty() || vector_db_path.empty()) {
        throw std::runtime_error("DB_PATH and VECTOR_DB_PATH cannot be empty");
    }

    if (feed_page_size < 1 || feed_max_markets < 1) {
        throw std::runtime_error("FEED_PAGE_SIZE and FEED_MAX_MARKETS must be positive");
    }

    if (embedding_dimension < 1) {
        throw std::runtime_error("EMBEDDING_DIMENSION must be positive");
    }

    if (index_batch_size < 1 || filter_batch_size < 1) {
        throw std::runtime_error("INDEX_BATCH_SIZE and FILTER_BATCH_SIZE must be positive");
    }

    if (filter_top_k < 1 || max_markets_in_bundle < 1 || search_results < 1) {
        throw std::runtime_error("FILTER_TOP_K, MAX_MARKETS_IN_BUNDLE and SEARCH_RESULTS must be positive");
    }

    if (default_budget < 0 || min_liquidity < 0) {
        throw std::runtime_error("DEFAULT_BUDGET and MIN_LIQUIDITY cannot be negative");
    }

    if (capability_requests_per_second < 1) {
        throw std::runtime_error("CAPABILITY_REQUESTS_PER_SECOND must be at least 1");
    }

    if (metrics.liquidity_reference <= 0 || metrics.sector_target <= 0) {
        throw std::runtime_error("LIQUIDITY_REFERENCE and SECTOR_TARGET must be positive");
    }

    if (http_port <= 0 || http_port > 65535) {
        throw std::runtime_error("HTTP_PORT must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}
