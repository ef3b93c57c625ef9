#include "config.hpp"
#include "record_store.hpp"
#include "embedder.hpp"
#include "similarity_index.hpp"
#include "market_feed_client.hpp"
#include "cache_refresher.hpp"
#include "llm_capabilities.hpp"
#include "hedge_service.hpp"
#include "api_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool> running{true};

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, shutting down...", signum);
    running = false;
}

namespace {

void print_usage() {
    std::cerr << "Usage: hedger [command]\n"
              << "  serve                      Run the HTTP API (default)\n"
              << "  update-cache [--resume]    Fetch markets, replace the cache and index it\n"
              << "  update-index [--resume]    Re-index cached markets\n"
              << "  hedge <concern> [budget]   Generate hedge bundles and print them as JSON\n"
              << "  status                     Print cache and index status\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    for (const auto& arg : args) {
        if (arg == flag) return true;
    }
    return false;
}

void log_progress(const nlohmann::json& event) {
    const auto& data = event["data"];
    if (event["type"] == "progress" && data.contains("completed_batches")) {
        spdlog::info("Indexed batch {}/{}", data["completed_batches"].get<int>(), data["total_batches"].get<int>());
    } else {
        spdlog::info("[{}] {}", event["type"].get<std::string>(), util::truncate(data.dump(), 200));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string command = args.empty() ? "serve" : args.front();

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {} ({})...", config.service_name, command);

        // 3. Storage and feed
        RecordStore store(config.db_path);
        auto embedder = make_embedder(config);
        SimilarityIndex index(config.vector_db_path, *embedder);
        MarketFeedClient feed(config);
        CacheRefresher refresher(config, store, &index, &feed);

        if (command == "update-cache") {
            auto report = refresher.refresh_cache(has_flag(args, "--resume"), log_progress);
            std::cout << report.to_json().dump(2) << std::endl;
            return report.success ? 0 : 1;
        }
        if (command == "update-index") {
            auto report = refresher.update_index(has_flag(args, "--resume"), log_progress);
            std::cout << report.to_json().dump(2) << std::endl;
            return report.success ? 0 : 1;
        }
        if (command == "status") {
            std::cout << refresher.cache_status().dump(2) << std::endl;
            return 0;
        }
        if (command != "serve" && command != "hedge") {
            print_usage();
            return 2;
        }

        // 4. Capabilities and pipeline
        auto limiter = std::make_shared<RateLimiter>(config.capability_requests_per_second);
        LlmRankingClient ranker(config, limiter);
        LlmThemeClient classifier(config, limiter);
        HedgeService service(config, store, &index, refresher, ranker, classifier);

        if (command == "hedge") {
            if (args.size() < 2) {
                print_usage();
                return 2;
            }
            double budget = args.size() > 2 ? std::stod(args[2]) : config.default_budget;
            auto result = service.generate_hedge(args[1], budget, static_cast<size_t>(config.search_results),
                                                 "", log_progress);
            std::cout << result.to_json().dump(2) << std::endl;
            return result.markets_found > 0 ? 0 : 1;
        }

        // 5. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 6. Serve until signalled
        ApiServer server(config, service);
        server.start();
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        server.stop();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Hedger has shut down gracefully.");
    return 0;
}
