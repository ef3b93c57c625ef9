#include "rate_limiter.hpp"
#include <algorithm>
#include <thread>

RateLimiter::RateLimiter(int requests_per_second, int burst_capacity)
    : requests_per_second_(std::max(requests_per_second, 1)),
      burst_capacity_(std::max(burst_capacity, 1)) {
}

bool RateLimiter::try_acquire(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& bucket = bucket_for(endpoint);
    refill(bucket);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }
    return false;
}

void RateLimiter::acquire(const std::string& endpoint) {
    while (!try_acquire(endpoint)) {
        auto wait = std::max(time_until_allowed(endpoint), std::chrono::milliseconds(1));
        std::this_thread::sleep_for(wait);
    }
}

std::chrono::milliseconds RateLimiter::time_until_allowed(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(endpoint);
    if (it == buckets_.end()) {
        return std::chrono::milliseconds(0);
    }

    refill(it->second);
    if (it->second.tokens >= 1.0) {
        return std::chrono::milliseconds(0);
    }

    double seconds_needed = (1.0 - it->second.tokens) / it->second.refill_rate;
    return std::chrono::milliseconds(static_cast<long long>(seconds_needed * 1000));
}

RateLimiter::TokenBucket& RateLimiter::bucket_for(const std::string& endpoint) {
    auto it = buckets_.find(endpoint);
    if (it == buckets_.end()) {
        it = buckets_.emplace(endpoint, TokenBucket(burst_capacity_, requests_per_second_)).first;
    }
    return it->second;
}

void RateLimiter::refill(TokenBucket& bucket) {
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();

    bucket.tokens = std::min(bucket.tokens + elapsed * bucket.refill_rate,
                             static_cast<double>(bucket.capacity));
    bucket.last_refill = now;
}
