#include "api_server.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <atomic>
#include <thread>

using json = nlohmann::json;

namespace {

ApiResponse error_response(int status, const std::string& detail) {
    return ApiResponse{status, json{{"detail", detail}}};
}

void write_response(httplib::Response& res, const ApiResponse& api) {
    res.status = api.status;
    res.set_content(api.body.dump(2), "application/json");
}

} // namespace

class ApiServer::Impl {
public:
    Impl(const Config& config, HedgeService& service)
        : config_(config), service_(service), running_(false) {}

    ~Impl() {
        stop();
    }

    void start(ApiServer& owner) {
        if (running_.exchange(true)) {
            return;
        }

        server_.Get("/health", [&owner](const httplib::Request&, httplib::Response& res) {
            write_response(res, owner.handle_health());
        });

        server_.Get("/markets/search", [&owner](const httplib::Request& req, httplib::Response& res) {
            std::map<std::string, std::string> params;
            for (const auto& [key, value] : req.params) {
                params.emplace(key, value);
            }
            write_response(res, owner.handle_search(params));
        });

        server_.Post("/hedge", [&owner](const httplib::Request& req, httplib::Response& res) {
            write_response(res, owner.handle_hedge(req.body));
        });

        server_.Get("/admin/cache-status", [&owner](const httplib::Request&, httplib::Response& res) {
            write_response(res, owner.handle_cache_status());
        });

        server_.Post("/admin/refresh", [&owner](const httplib::Request& req, httplib::Response& res) {
            bool resume = req.has_param("resume") && util::to_lower(req.get_param_value("resume")) == "true";
            write_response(res, owner.handle_refresh(resume));
        });

        server_thread_ = std::thread([this]() {
            spdlog::info("API server starting on {}:{}", config_.http_host, config_.http_port);
            if (!server_.listen(config_.http_host.c_str(), config_.http_port)) {
                spdlog::error("API server failed to listen on {}:{}", config_.http_host, config_.http_port);
            }
        });
    }

    void stop() {
        if (running_.exchange(false)) {
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("API server stopped");
        }
    }

    ApiResponse health() const {
        json status;
        status["service"] = config_.service_name;
        status["status"] = "healthy";
        status["version"] = "1.0.0";
        status["timestamp"] = util::current_iso8601();

        auto cache = service_.cache_status();
        bool store_ok = cache.value("store_healthy", false);
        status["components"]["record_store"] = store_ok ? "healthy" : "unhealthy";
        if (cache.value("index_configured", false)) {
            status["components"]["similarity_index"] = cache.value("index_healthy", false) ? "healthy" : "unhealthy";
        } else {
            status["components"]["similarity_index"] = "not_configured";
        }

        if (!store_ok) {
            status["status"] = "unhealthy";
            return ApiResponse{503, status};
        }
        return ApiResponse{200, status};
    }

    ApiResponse search(const std::map<std::string, std::string>& params) const {
        auto q = params.find("q");
        if (q == params.end() || util::trim(q->second).empty()) {
            return error_response(400, "Query parameter 'q' is required");
        }

        int n = 50;
        double min_liquidity = config_.min_liquidity;
        try {
            if (auto it = params.find("n"); it != params.end()) {
                n = std::stoi(it->second);
            }
            if (auto it = params.find("min_liquidity"); it != params.end()) {
                min_liquidity = std::stod(it->second);
            }
        } catch (const std::exception&) {
            return error_response(400, "Parameters 'n' and 'min_liquidity' must be numeric");
        }
        if (n < 1 || n > 500) {
            return error_response(400, "Parameter 'n' must be between 1 and 500");
        }

        spdlog::info("Market search request: query='{}'", util::truncate(q->second, 50));
        try {
            auto results = service_.search(q->second, static_cast<size_t>(n), min_liquidity);
            json markets = json::array();
            for (const auto& [record, score] : results) {
                json entry = record.to_json();
                entry["score"] = score;
                markets.push_back(entry);
            }
            return ApiResponse{200, json{{"markets", markets}, {"total_count", results.size()}}};
        } catch (const std::exception& e) {
            spdlog::error("Error searching markets: {}", e.what());
            return error_response(500, std::string("Search failed: ") + e.what());
        }
    }

    ApiResponse hedge(const std::string& body) {
        auto request = json::parse(body, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            return error_response(400, "Request body must be a JSON object");
        }

        std::string concern;
        double budget = config_.default_budget;
        int num_markets = config_.search_results;
        std::string context;
        try {
            concern = request.at("concern").get<std::string>();
            budget = request.value("budget", budget);
            num_markets = request.value("num_markets", num_markets);
            context = request.value("context", context);
        } catch (const json::exception& e) {
            return error_response(400, std::string("Invalid hedge request: ") + e.what());
        }

        if (util::trim(concern).empty()) {
            return error_response(400, "Field 'concern' must not be empty");
        }
        if (budget < 0) {
            return error_response(400, "Field 'budget' must be non-negative");
        }
        if (num_markets < 10 || num_markets > 1000) {
            return error_response(400, "Field 'num_markets' must be between 10 and 1000");
        }

        try {
            auto result = service_.generate_hedge(concern, budget, static_cast<size_t>(num_markets), context);
            if (result.markets_found == 0) {
                return error_response(404, "No markets found");
            }
            return ApiResponse{200, result.to_json()};
        } catch (const std::exception& e) {
            return error_response(500, std::string("Hedge generation failed: ") + e.what());
        }
    }

    ApiResponse cache_status() const {
        try {
            return ApiResponse{200, service_.cache_status()};
        } catch (const std::exception& e) {
            spdlog::error("Error reading cache status: {}", e.what());
            return error_response(500, e.what());
        }
    }

    ApiResponse refresh(bool resume) {
        spdlog::info("Starting market cache refresh (resume: {})", resume);
        try {
            auto report = service_.refresh_cache(resume);
            json body = report.to_json();
            body["status"] = report.success ? "success" : "failed";
            body["message"] = report.success
                ? fmt::format("Cached {} markets, indexed {}", report.fetched, report.indexed)
                : std::string("Refresh failed, previous cache kept");
            return ApiResponse{report.success ? 200 : 502, body};
        } catch (const std::exception& e) {
            spdlog::error("Error refreshing cache: {}", e.what());
            return error_response(500, std::string("Failed to refresh cache: ") + e.what());
        }
    }

private:
    Config config_;
    HedgeService& service_;
    std::atomic<bool> running_;
    httplib::Server server_;
    std::thread server_thread_;
};

ApiServer::ApiServer(const Config& config, HedgeService& service)
    : pImpl_(std::make_unique<Impl>(config, service)) {}

ApiServer::~ApiServer() = default;

void ApiServer::start() {
    pImpl_->start(*this);
}

void ApiServer::stop() {
    pImpl_->stop();
}

ApiResponse ApiServer::handle_health() const {
    return pImpl_->health();
}

ApiResponse ApiServer::handle_search(const std::map<std::string, std::string>& params) const {
    return pImpl_->search(params);
}

ApiResponse ApiServer::handle_hedge(const std::string& body) {
    return pImpl_->hedge(body);
}

ApiResponse ApiServer::handle_cache_status() const {
    return pImpl_->cache_status();
}

ApiResponse ApiServer::handle_refresh(bool resume) {
    return pImpl_->refresh(resume);
}
