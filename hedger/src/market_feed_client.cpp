#include "market_feed_client.hpp"
#include "backoff_manager.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <unordered_map>

using json = nlohmann::json;

namespace {

// Gamma encodes some list fields as JSON inside a string
json decode_list(const json& value) {
    if (value.is_array()) {
        return value;
    }
    if (value.is_string()) {
        auto parsed = json::parse(value.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_array()) {
            return parsed;
        }
    }
    return json::array();
}

std::optional<double> number_of(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& s = value.get<std::string>();
        if (s.empty()) return std::nullopt;
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// First non-zero numeric value among the given keys
double first_number(const json& item, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (!item.contains(key)) continue;
        auto v = number_of(item[key]);
        if (v && *v != 0.0) {
            return *v;
        }
    }
    return 0.0;
}

std::string string_of(const json& item, const char* key) {
    if (!item.contains(key)) return "";
    const auto& v = item[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return "";
}

std::vector<Outcome> parse_outcomes(const json& item) {
    std::vector<Outcome> outcomes;
    if (!item.contains("outcomePrices")) {
        return outcomes;
    }

    json prices = decode_list(item["outcomePrices"]);
    std::vector<std::string> names = {"Yes", "No"};
    if (item.contains("outcomes")) {
        json raw = decode_list(item["outcomes"]);
        if (!raw.empty()) {
            names.clear();
            for (const auto& n : raw) {
                names.push_back(n.is_string() ? n.get<std::string>() : n.dump());
            }
        }
    }

    for (size_t i = 0; i < prices.size(); ++i) {
        auto price = number_of(prices[i]);
        if (!price) {
            continue;
        }
        Outcome outcome;
        outcome.name = i < names.size() ? names[i] : fmt::format("Outcome {}", i + 1);
        outcome.price = *price;
        outcomes.push_back(outcome);
    }
    return outcomes;
}

} // namespace

class MarketFeedClient::Impl {
public:
    Impl(const Config& config, PageFetcher fetcher)
        : config_(config),
          backoff_(config.base_backoff_seconds, config.max_backoff_seconds),
          fetcher_(std::move(fetcher)) {
        if (!fetcher_) {
            fetcher_ = [this](const std::string& feed, int limit, int offset) {
                return fetch_page_http(feed, limit, offset);
            };
        }
    }

    std::vector<MarketRecord> fetch_all() {
        spdlog::info("Fetching from /markets endpoint");
        auto from_markets = fetch_markets_feed();
        spdlog::info("Got {} markets from /markets", from_markets.size());

        spdlog::info("Fetching from /events endpoint");
        auto from_events = fetch_events_feed();
        spdlog::info("Got {} markets from /events", from_events.size());

        auto merged = MarketFeedClient::merge_feeds(from_markets, from_events);
        spdlog::info("Total unique markets after dedup: {}", merged.size());
        return merged;
    }

    std::vector<MarketRecord> fetch_markets_feed() {
        return page_through("markets", [](const json& item, std::vector<MarketRecord>& out) {
            if (auto record = MarketFeedClient::parse_market(item)) {
                out.push_back(std::move(*record));
            }
        });
    }

    std::vector<MarketRecord> fetch_events_feed() {
        return page_through("events", [](const json& event, std::vector<MarketRecord>& out) {
            if (!event.is_object() || !event.contains("markets") || !event["markets"].is_array()) {
                return;
            }
            std::string event_description = string_of(event, "description");
            std::string event_slug = string_of(event, "slug");

            for (auto item : event["markets"]) {
                if (!item.is_object()) continue;
                if (string_of(item, "description").empty()) {
                    item["description"] = event_description;
                }
                if (!event_slug.empty()) {
                    item["slug"] = event_slug;
                }
                if (auto record = MarketFeedClient::parse_market(item)) {
                    out.push_back(std::move(*record));
                }
            }
        });
    }

private:
    template <typename ItemHandler>
    std::vector<MarketRecord> page_through(const std::string& feed, ItemHandler handle) {
        std::vector<MarketRecord> records;
        int offset = 0;
        const int page_size = config_.feed_page_size;

        while (true) {
            spdlog::debug("Fetching /{} offset={}", feed, offset);
            auto page = fetch_with_retry(feed, page_size, offset);
            if (!page) {
                spdlog::error("Error fetching /{} at offset {}, stopping", feed, offset);
                break;
            }
            if (!page->is_array() || page->empty()) {
                spdlog::debug("No more data from /{}", feed);
                break;
            }

            for (const auto& item : *page) {
                handle(item, records);
            }
            spdlog::debug("/{} page: {} items, total: {}", feed, page->size(), records.size());

            if (static_cast<int>(records.size()) >= config_.feed_max_markets) {
                spdlog::info("Reached max_markets limit: {}", config_.feed_max_markets);
                break;
            }
            if (static_cast<int>(page->size()) < page_size) {
                break;
            }
            offset += page_size;
        }
        return records;
    }

    std::optional<json> fetch_with_retry(const std::string& feed, int limit, int offset) {
        for (int attempt = 0; attempt <= config_.feed_max_retries; ++attempt) {
            backoff_.wait(feed);
            auto page = fetcher_(feed, limit, offset);
            if (page) {
                backoff_.record_success(feed);
                return page;
            }
            backoff_.record_failure(feed);
            spdlog::warn("Fetch of /{} failed (attempt {}/{})", feed, attempt + 1, config_.feed_max_retries + 1);
        }
        backoff_.record_success(feed);
        return std::nullopt;
    }

    std::optional<json> fetch_page_http(const std::string& feed, int limit, int offset) {
        auto response = cpr::Get(
            cpr::Url{config_.gamma_api_url + "/" + feed},
            cpr::Parameters{{"limit", std::to_string(limit)},
                            {"offset", std::to_string(offset)},
                            {"active", "true"},
                            {"closed", "false"},
                            {"enable_order_book", "true"}},
            cpr::Timeout{config_.http_timeout_ms},
            cpr::Header{{"User-Agent", "PolyHedge/1.0"}}
        );

        if (response.error) {
            spdlog::error("Request to /{} failed: {}", feed, response.error.message);
            return std::nullopt;
        }
        if (response.status_code != 200) {
            spdlog::error("Request to /{} failed, status: {}", feed, response.status_code);
            return std::nullopt;
        }

        auto parsed = json::parse(response.text, nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::error("Invalid JSON from /{}", feed);
            return std::nullopt;
        }
        return std::make_optional(std::move(parsed));
    }

    const Config& config_;
    BackoffManager backoff_;
    PageFetcher fetcher_;
};

MarketFeedClient::MarketFeedClient(const Config& config)
    : pImpl_(std::make_unique<Impl>(config, nullptr)) {}

MarketFeedClient::MarketFeedClient(const Config& config, PageFetcher fetcher)
    : pImpl_(std::make_unique<Impl>(config, std::move(fetcher))) {}

MarketFeedClient::~MarketFeedClient() = default;

std::vector<MarketRecord> MarketFeedClient::fetch_all() {
    return pImpl_->fetch_all();
}

std::vector<MarketRecord> MarketFeedClient::fetch_markets_feed() {
    return pImpl_->fetch_markets_feed();
}

std::vector<MarketRecord> MarketFeedClient::fetch_events_feed() {
    return pImpl_->fetch_events_feed();
}

std::optional<MarketRecord> MarketFeedClient::parse_market(const json& item) {
    if (!item.is_object()) {
        return std::nullopt;
    }

    MarketRecord record;
    record.id = string_of(item, "id");
    if (record.id.empty()) {
        return std::nullopt;
    }
    record.question = string_of(item, "question");
    record.description = string_of(item, "description");
    record.outcomes = parse_outcomes(item);
    record.liquidity = first_number(item, {"liquidity", "liquidityNum"});
    record.volume = first_number(item, {"volume", "volumeNum"});

    std::string end_date = string_of(item, "endDate");
    if (!end_date.empty()) {
        record.end_date = end_date;
    }
    record.active = true;

    for (const char* key : {"slug", "conditionId"}) {
        std::string value = string_of(item, key);
        if (!value.empty()) {
            record.slug = value;
            break;
        }
    }
    if (!record.slug) {
        record.slug = record.id;
    }
    return record;
}

std::vector<MarketRecord> MarketFeedClient::merge_feeds(const std::vector<MarketRecord>& first,
                                                        const std::vector<MarketRecord>& second) {
    std::vector<MarketRecord> merged;
    std::unordered_map<std::string, size_t> position;

    auto absorb = [&](const std::vector<MarketRecord>& feed) {
        for (const auto& record : feed) {
            auto it = position.find(record.id);
            if (it == position.end()) {
                position.emplace(record.id, merged.size());
                merged.push_back(record);
            } else {
                merged[it->second] = record;
            }
        }
    };

    absorb(first);
    absorb(second);
    return merged;
}
