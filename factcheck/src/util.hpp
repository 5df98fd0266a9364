#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
bool get_env_bool(const std::string& name, bool default_value);

// Logging
void setup_logging(const std::string& logger_name, const std::string& level);

// String utilities
std::vector<std::string> split_any(const std::string& str, const std::string& delimiters);
std::string trim(const std::string& str);
std::string to_lower(std::string str);
bool contains_ci(const std::string& haystack, const std::string& needle);
bool contains_any_ci(const std::string& haystack, const std::vector<std::string>& needles);
// Cuts to at most max_length bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& str, size_t max_length);

// Hashing
std::string sha256_hex(const std::string& data);

// Time utilities
std::string current_iso8601();
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string);
int64_t now_epoch_ms();

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
