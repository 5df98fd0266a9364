#pragma once
#include "types.hpp"
#include <string>

// Provider model ids for each tier
struct ModelCatalog {
    std::string extraction;
    std::string fast;
    std::string standard;
    std::string premium;

    const std::string& model_for(ModelTier tier) const;
};

// Queue settings for one upstream service
struct UpstreamSettings {
    int rate_limit_per_minute = 0;
    int backoff_initial_ms = 1000;
    double backoff_factor = 2.0;
    int backoff_max_ms = 15000;
};

class Config {
public:
    // Service info
    std::string service_name = "factcheck";
    std::string log_level = "info";

    // AI provider
    std::string ai_provider = "openai";
    std::string openai_api_key;
    std::string anthropic_api_key;
    std::string openai_api_url = "https://api.openai.com/v1/chat/completions";
    std::string anthropic_api_url = "https://api.anthropic.com/v1/messages";
    std::string anthropic_version = "2023-06-01";

    ModelCatalog openai_models = {"gpt-4o-mini", "gpt-4o-mini", "gpt-4o-mini", "gpt-4o"};
    ModelCatalog anthropic_models = {"claude-3-5-haiku-latest", "claude-3-5-haiku-latest",
                                     "claude-3-7-sonnet-latest", "claude-3-opus-latest"};

    // Brave search (optional evidence source)
    std::string brave_api_key;
    std::string brave_api_url = "https://api.search.brave.com/res/v1/web/search";
    int brave_results_count = 2;

    // Per-upstream rate limiting and backoff
    UpstreamSettings openai_upstream = {5, 1000, 2.0, 15000};
    UpstreamSettings anthropic_upstream = {5, 1000, 2.0, 15000};
    UpstreamSettings brave_upstream = {0, 500, 1.5, 5000};
    int request_timeout_ms = 30000;

    // Check behaviour
    std::string model_tier = "standard";
    bool auto_select_model = true;
    bool use_multi_model = true;
    int consistency_prompts = 1;
    bool cost_sensitive = true;
    std::string urgency = "medium";
    int max_tokens = 500;
    int extraction_max_tokens = 300;
    int max_chars = 12000;
    int check_max_retries = 2;
    int check_initial_delay_ms = 2000;

    // Response cache
    bool enable_caching = true;
    int cache_max_size = 100;
    int cache_ttl_hours = 24;
    std::string cache_persist = "none"; // none | file | redis
    std::string cache_dir = "./cache";
    int cache_persist_debounce_ms = 5000;

    // Redis (cache persistence only)
    std::string redis_host = "localhost";
    int redis_port = 6379;
    std::string redis_password;
    std::string redis_key_prefix = "factcheck:";

    // HTTP service
    std::string listen_host = "0.0.0.0";
    int listen_port = 8085;

    static Config from_env();
    void validate() const;

    Provider provider() const;
    const std::string& provider_api_key() const;
    const ModelCatalog& provider_models() const;
    const UpstreamSettings& provider_upstream() const;
};
