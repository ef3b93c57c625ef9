#pragma once
#include <string>
#include <unordered_set>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string truncate(const std::string& str, size_t max_len);
bool contains_ci(const std::string& haystack, const std::string& needle);

// Lowercased whitespace-separated words of a string
std::unordered_set<std::string> word_set(const std::string& text);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
double unix_seconds_now();

// Numeric utilities
double round_to(double value, int decimals);
inline double round_cents(double value) { return round_to(value, 2); }

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
