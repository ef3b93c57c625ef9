#include "backoff_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <thread>

BackoffManager::BackoffManager(double base_delay_seconds, double max_delay_seconds, double multiplier)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      multiplier_(multiplier) {
}

void BackoffManager::record_failure(const std::string& feed) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& state = states_[feed];
    state.failures++;
    state.last_failure = std::chrono::steady_clock::now();
    state.delay = delay_for(state.failures);
    spdlog::debug("Backoff for {}: {} failure(s), next attempt in {}ms", feed, state.failures, state.delay.count());
}

void BackoffManager::record_success(const std::string& feed) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(feed);
}

int BackoffManager::failure_count(const std::string& feed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(feed);
    return it == states_.end() ? 0 : it->second.failures;
}

std::chrono::milliseconds BackoffManager::time_until_allowed(const std::string& feed) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(feed);
    if (it == states_.end() || it->second.failures == 0) {
        return std::chrono::milliseconds(0);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second.last_failure);
    if (elapsed >= it->second.delay) {
        return std::chrono::milliseconds(0);
    }
    return it->second.delay - elapsed;
}

void BackoffManager::wait(const std::string& feed) {
    auto remaining = time_until_allowed(feed);
    if (remaining.count() > 0) {
        spdlog::info("Backing off {} for {}ms", feed, remaining.count());
        std::this_thread::sleep_for(remaining);
    }
}

void BackoffManager::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.clear();
}

std::chrono::milliseconds BackoffManager::delay_for(int failures) const {
    if (failures <= 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_seconds = base_delay_seconds_ * std::pow(multiplier_, failures - 1);
    delay_seconds = std::min(delay_seconds, max_delay_seconds_);
    delay_seconds = util::random_jitter(delay_seconds, 0.1);

    return std::chrono::milliseconds(static_cast<long long>(delay_seconds * 1000));
}
