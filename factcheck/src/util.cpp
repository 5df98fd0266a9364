#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <openssl/sha.h>
#include <cstdlib>
#include <sstream>
#include <algorithm>
#include <random>
#include <iomanip>
#include <cctype>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

bool get_env_bool(const std::string& name, bool default_value) {
    auto value = to_lower(trim(get_env_var(name)));
    if (value.empty()) return default_value;
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

void setup_logging(const std::string& logger_name, const std::string& level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(logger_name, console_sink);
    spdlog::set_default_logger(logger);

    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
}

std::vector<std::string> split_any(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : str) {
        if (delimiters.find(c) != std::string::npos) {
            tokens.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    tokens.push_back(current);

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool contains_any_ci(const std::string& haystack, const std::vector<std::string>& needles) {
    auto lowered = to_lower(haystack);
    return std::any_of(needles.begin(), needles.end(), [&lowered](const std::string& needle) {
        return lowered.find(needle) != std::string::npos;
    });
}

std::string truncate_utf8(const std::string& str, size_t max_length) {
    if (str.size() <= max_length) {
        return str;
    }

    // Back off over continuation bytes so the cut never splits a character
    size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        // Date-only values are common in search result metadata
        tm = {};
        std::istringstream date_only(iso_string);
        date_only >> std::get_time(&tm, "%Y-%m-%d");
        if (date_only.fail()) {
            return std::nullopt;
        }
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

double random_jitter(double base_value, double jitter_factor) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);

    double jitter = dis(gen);
    return base_value * (1.0 + jitter);
}

} // namespace util
