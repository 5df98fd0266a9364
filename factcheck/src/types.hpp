#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>

// Ordered: downgrade logic relies on Extraction < Fast < Standard < Premium
enum class ModelTier {
    Extraction = 0,
    Fast = 1,
    Standard = 2,
    Premium = 3
};

enum class Provider {
    OpenAI,
    Anthropic
};

enum class Complexity {
    Low,
    Medium,
    High
};

enum class Urgency {
    Low,
    Medium,
    High
};

enum class Task {
    FactCheck,
    ClaimExtraction,
    SearchQuery
};

enum class Confidence {
    High,
    Moderate,
    Low
};

enum class ErrorCategory {
    RateLimit,
    AuthError,
    Temporary,
    ContentPolicy,
    ContextLength,
    Unknown
};

enum class CheckStage {
    Start,
    Search,
    Analysis,
    Verification,
    Retry,
    Fallback
};

struct ModelRequest {
    std::string prompt;
    std::string model;
    int max_tokens = 500;
};

struct SearchResult {
    std::string title;
    std::string description;
    std::string url;
    std::string domain;
    std::string date;
    std::string type = "web"; // "web" or "news"
};

struct Evidence {
    std::string search_context;
    std::vector<SearchResult> results;
    std::string references;
};

struct CheckResult {
    std::string result;
    std::string query_text;
    std::optional<int> rating;
    std::optional<Confidence> confidence;
    std::string model;
    bool degraded = false;
    std::optional<ErrorCategory> error_category;
    std::optional<std::chrono::milliseconds> retry_after;
};

const char* to_string(ModelTier tier);
const char* to_string(Provider provider);
const char* to_string(Complexity complexity);
const char* to_string(Urgency urgency);
const char* to_string(Confidence confidence);
const char* to_string(ErrorCategory category);
const char* to_string(CheckStage stage);

std::optional<ModelTier> parse_model_tier(const std::string& value);
std::optional<Provider> parse_provider(const std::string& value);
std::optional<Urgency> parse_urgency(const std::string& value);
