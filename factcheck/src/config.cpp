#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_bool;

namespace {

UpstreamSettings upstream_from_env(const std::string& prefix, const UpstreamSettings& defaults) {
    UpstreamSettings settings;
    settings.rate_limit_per_minute = std::stoi(get_env_var(prefix + "_RATE_LIMIT_PER_MINUTE",
        std::to_string(defaults.rate_limit_per_minute)));
    settings.backoff_initial_ms = std::stoi(get_env_var(prefix + "_BACKOFF_INITIAL_MS",
        std::to_string(defaults.backoff_initial_ms)));
    settings.backoff_factor = std::stod(get_env_var(prefix + "_BACKOFF_FACTOR",
        std::to_string(defaults.backoff_factor)));
    settings.backoff_max_ms = std::stoi(get_env_var(prefix + "_BACKOFF_MAX_MS",
        std::to_string(defaults.backoff_max_ms)));
    return settings;
}

ModelCatalog models_from_env(const std::string& prefix, const ModelCatalog& defaults) {
    ModelCatalog catalog;
    catalog.extraction = get_env_var(prefix + "_MODEL_EXTRACTION", defaults.extraction);
    catalog.fast = get_env_var(prefix + "_MODEL_FAST", defaults.fast);
    catalog.standard = get_env_var(prefix + "_MODEL_STANDARD", defaults.standard);
    catalog.premium = get_env_var(prefix + "_MODEL_PREMIUM", defaults.premium);
    return catalog;
}

} // namespace

const std::string& ModelCatalog::model_for(ModelTier tier) const {
    switch (tier) {
        case ModelTier::Extraction: return extraction;
        case ModelTier::Fast: return fast;
        case ModelTier::Standard: return standard;
        case ModelTier::Premium: return premium;
    }
    return standard;
}

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "factcheck");
    config.log_level = get_env_var("LOG_LEVEL", "info");

    // AI provider
    config.ai_provider = get_env_var("AI_PROVIDER", "openai");
    config.openai_api_key = get_env_var("OPENAI_API_KEY");
    config.anthropic_api_key = get_env_var("ANTHROPIC_API_KEY");
    config.openai_api_url = get_env_var("OPENAI_API_URL", config.openai_api_url);
    config.anthropic_api_url = get_env_var("ANTHROPIC_API_URL", config.anthropic_api_url);
    config.anthropic_version = get_env_var("ANTHROPIC_VERSION", config.anthropic_version);
    config.openai_models = models_from_env("OPENAI", config.openai_models);
    config.anthropic_models = models_from_env("ANTHROPIC", config.anthropic_models);

    // Brave
    config.brave_api_key = get_env_var("BRAVE_API_KEY");
    config.brave_api_url = get_env_var("BRAVE_API_URL", config.brave_api_url);
    config.brave_results_count = std::stoi(get_env_var("BRAVE_RESULTS_COUNT", "2"));

    // Rate limiting
    config.openai_upstream = upstream_from_env("OPENAI", config.openai_upstream);
    config.anthropic_upstream = upstream_from_env("ANTHROPIC", config.anthropic_upstream);
    config.brave_upstream = upstream_from_env("BRAVE", config.brave_upstream);
    config.request_timeout_ms = std::stoi(get_env_var("REQUEST_TIMEOUT_MS", "30000"));

    // Check behaviour
    config.model_tier = get_env_var("MODEL_TIER", "standard");
    config.auto_select_model = get_env_bool("AUTO_SELECT_MODEL", true);
    config.use_multi_model = get_env_bool("USE_MULTI_MODEL", true);
    config.consistency_prompts = std::stoi(get_env_var("CONSISTENCY_PROMPTS", "1"));
    config.cost_sensitive = get_env_bool("COST_SENSITIVE", true);
    config.urgency = get_env_var("URGENCY", "medium");
    config.max_tokens = std::stoi(get_env_var("MAX_TOKENS", "500"));
    config.extraction_max_tokens = std::stoi(get_env_var("EXTRACTION_MAX_TOKENS", "300"));
    config.max_chars = std::stoi(get_env_var("MAX_CHARS", "12000"));
    config.check_max_retries = std::stoi(get_env_var("CHECK_MAX_RETRIES", "2"));
    config.check_initial_delay_ms = std::stoi(get_env_var("CHECK_INITIAL_DELAY_MS", "2000"));

    // Cache
    config.enable_caching = get_env_bool("ENABLE_CACHING", true);
    config.cache_max_size = std::stoi(get_env_var("CACHE_MAX_SIZE", "100"));
    config.cache_ttl_hours = std::stoi(get_env_var("CACHE_TTL_HOURS", "24"));
    config.cache_persist = get_env_var("CACHE_PERSIST", "none");
    config.cache_dir = get_env_var("CACHE_DIR", "./cache");
    config.cache_persist_debounce_ms = std::stoi(get_env_var("CACHE_PERSIST_DEBOUNCE_MS", "5000"));

    // Redis
    config.redis_host = get_env_var("REDIS_HOST", "localhost");
    config.redis_port = std::stoi(get_env_var("REDIS_PORT", "6379"));
    config.redis_password = get_env_var("REDIS_PASSWORD");
    config.redis_key_prefix = get_env_var("REDIS_KEY_PREFIX", "factcheck:");

    // HTTP
    config.listen_host = get_env_var("LISTEN_HOST", "0.0.0.0");
    config.listen_port = std::stoi(get_env_var("LISTEN_PORT", "8085"));

    return config;
}

void Config::validate() const {
    if (!parse_provider(ai_provider)) {
        throw std::runtime_error("Unsupported AI provider: " + ai_provider);
    }

    if (provider_api_key().empty()) {
        throw std::runtime_error(std::string("Missing API key for provider ") + to_string(provider()));
    }

    if (!parse_model_tier(model_tier)) {
        throw std::runtime_error("Unknown model tier: " + model_tier);
    }

    if (!parse_urgency(urgency)) {
        throw std::runtime_error("Unknown urgency: " + urgency);
    }

    if (cache_persist != "none" && cache_persist != "file" && cache_persist != "redis") {
        throw std::runtime_error("CACHE_PERSIST must be one of none, file, redis");
    }

    if (cache_max_size < 1) {
        throw std::runtime_error("Cache max size must be at least 1");
    }

    if (max_tokens < 1 || extraction_max_tokens < 1) {
        throw std::runtime_error("Token budgets must be positive");
    }

    if (consistency_prompts < 1 || consistency_prompts > 4) {
        throw std::runtime_error("Consistency prompts must be between 1 and 4");
    }

    for (const auto* upstream : {&openai_upstream, &anthropic_upstream, &brave_upstream}) {
        if (upstream->rate_limit_per_minute < 0 || upstream->backoff_initial_ms < 0 ||
            upstream->backoff_max_ms < upstream->backoff_initial_ms || upstream->backoff_factor < 1.0) {
            throw std::runtime_error("Invalid upstream rate limit or backoff settings");
        }
    }

    if (listen_port < 1 || listen_port > 65535) {
        throw std::runtime_error("Listen port must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}

Provider Config::provider() const {
    return parse_provider(ai_provider).value_or(Provider::OpenAI);
}

const std::string& Config::provider_api_key() const {
    return provider() == Provider::Anthropic ? anthropic_api_key : openai_api_key;
}

const ModelCatalog& Config::provider_models() const {
    return provider() == Provider::Anthropic ? anthropic_models : openai_models;
}

const UpstreamSettings& Config::provider_upstream() const {
    return provider() == Provider::Anthropic ? anthropic_upstream : openai_upstream;
}
