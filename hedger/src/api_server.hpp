#pragma once
#include "config.hpp"
#include "hedge_service.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

// Status code plus JSON body produced by a route handler
struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// HTTP front end for the hedge service
class ApiServer {
public:
    ApiServer(const Config& config, HedgeService& service);
    ~ApiServer();

    // Starts listening on a background thread
    void start();
    void stop();

    // Route handlers, independent of the transport
    ApiResponse handle_health() const;
    ApiResponse handle_search(const std::map<std::string, std::string>& params) const;
    ApiResponse handle_hedge(const std::string& body);
    ApiResponse handle_cache_status() const;
    ApiResponse handle_refresh(bool resume);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
