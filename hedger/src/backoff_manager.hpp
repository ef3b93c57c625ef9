#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-feed exponential backoff for retried source fetches
class BackoffManager {
public:
    BackoffManager(double base_delay_seconds = 1.0, double max_delay_seconds = 60.0, double multiplier = 2.0);

    void record_failure(const std::string& feed);

    // Clears the failure streak for a feed
    void record_success(const std::string& feed);

    int failure_count(const std::string& feed);

    std::chrono::milliseconds time_until_allowed(const std::string& feed);

    // Blocks until the feed's current backoff window has passed
    void wait(const std::string& feed);

    void reset_all();

private:
    struct FeedState {
        int failures = 0;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::milliseconds delay{0};
    };

    std::chrono::milliseconds delay_for(int failures) const;

    std::mutex mutex_;
    std::unordered_map<std::string, FeedState> states_;
    double base_delay_seconds_;
    double max_delay_seconds_;
    double multiplier_;
};
