#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Token buckets keyed by capability endpoint
class RateLimiter {
public:
    RateLimiter(int requests_per_second = 2, int burst_capacity = 4);

    // Takes a token if one is available
    bool try_acquire(const std::string& endpoint = "default");

    // Blocks until a token is available, then takes it
    void acquire(const std::string& endpoint = "default");

    std::chrono::milliseconds time_until_allowed(const std::string& endpoint = "default");

private:
    struct TokenBucket {
        double tokens;
        int capacity;
        double refill_rate;
        std::chrono::steady_clock::time_point last_refill;

        TokenBucket(int cap, double rate)
            : tokens(cap), capacity(cap), refill_rate(rate),
              last_refill(std::chrono::steady_clock::now()) {}
    };

    TokenBucket& bucket_for(const std::string& endpoint);
    void refill(TokenBucket& bucket);

    std::mutex mutex_;
    std::unordered_map<std::string, TokenBucket> buckets_;
    int requests_per_second_;
    int burst_capacity_;
};
