#include "service.hpp"
#include "anthropic_provider.hpp"
#include "brave_search_provider.hpp"
#include "byte_store.hpp"
#include "openai_provider.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace {

std::shared_ptr<ModelProvider> make_model_provider(const Config& config) {
    if (config.provider() == Provider::Anthropic) {
        return std::make_shared<AnthropicProvider>(config.anthropic_api_key, config.anthropic_api_url,
                                                   config.anthropic_version, config.anthropic_models,
                                                   config.request_timeout_ms);
    }
    return std::make_shared<OpenAiProvider>(config.openai_api_key, config.openai_api_url,
                                            config.openai_models, config.request_timeout_ms);
}

std::shared_ptr<ByteStore> make_cache_store(const Config& config) {
    if (config.cache_persist == "file") {
        spdlog::info("Persisting response cache under {}", config.cache_dir);
        return std::make_shared<FileByteStore>(config.cache_dir);
    }
    if (config.cache_persist == "redis") {
        spdlog::info("Persisting response cache to Redis at {}:{}", config.redis_host, config.redis_port);
        return std::make_shared<RedisByteStore>(config.redis_host, config.redis_port,
                                                config.redis_password, config.redis_key_prefix);
    }
    return nullptr;
}

} // namespace

RequestQueueOptions queue_options_from(const std::string& name, const UpstreamSettings& upstream) {
    RequestQueueOptions options;
    options.name = name;
    options.rate_limit_per_minute = upstream.rate_limit_per_minute;
    options.backoff = BackoffPolicy(std::chrono::milliseconds(upstream.backoff_initial_ms),
                                    upstream.backoff_factor,
                                    std::chrono::milliseconds(upstream.backoff_max_ms));
    return options;
}

OrchestratorOptions orchestrator_options_from(const Config& config) {
    OrchestratorOptions options;
    options.use_multi_model = config.use_multi_model;
    options.consistency_prompts = config.consistency_prompts;
    options.auto_select_model = config.auto_select_model;
    options.default_tier = parse_model_tier(config.model_tier).value_or(ModelTier::Standard);
    options.cost_sensitive = config.cost_sensitive;
    options.urgency = parse_urgency(config.urgency).value_or(Urgency::Medium);
    options.enable_caching = config.enable_caching;
    options.max_tokens = config.max_tokens;
    options.emergency_max_tokens = config.extraction_max_tokens;
    options.max_chars = static_cast<size_t>(config.max_chars);
    options.check_max_retries = config.check_max_retries;
    options.check_initial_delay = std::chrono::milliseconds(config.check_initial_delay_ms);
    return options;
}

ResponseCacheOptions cache_options_from(const Config& config) {
    ResponseCacheOptions options;
    options.max_size = static_cast<size_t>(config.cache_max_size);
    options.ttl = std::chrono::hours(config.cache_ttl_hours);
    options.persist_debounce = std::chrono::milliseconds(config.cache_persist_debounce_ms);
    return options;
}

Service::Service(const Config& config)
    : config_(config) {
    auto cache_options = cache_options_from(config);
    cache_options.store = make_cache_store(config);
    cache_ = std::make_shared<ResponseCache>(std::move(cache_options));

    auto provider = make_model_provider(config);
    model_client_ = std::make_shared<ModelClient>(
        provider, queue_options_from(to_string(config.provider()), config.provider_upstream()),
        cache_, config.extraction_max_tokens);

    if (!config.brave_api_key.empty()) {
        auto brave = std::make_shared<BraveSearchProvider>(config.brave_api_key, config.brave_api_url,
                                                           config.brave_results_count, config.request_timeout_ms);
        search_client_ = std::make_shared<SearchClient>(brave, queue_options_from("brave", config.brave_upstream));
    } else {
        spdlog::warn("BRAVE_API_KEY not set, checks will run without search evidence");
    }

    orchestrator_ = std::make_unique<Orchestrator>(model_client_, search_client_,
                                                   orchestrator_options_from(config));
    orchestrator_->set_progress_listener([](CheckStage stage, const std::string& fingerprint) {
        spdlog::debug("Check {} reached stage {}", fingerprint.substr(0, 12), to_string(stage));
    });

    server_ = std::make_unique<CheckServer>(config, *orchestrator_, *model_client_);
}

Service::~Service() {
    shutdown();
}

void Service::run() {
    running_ = true;
    server_->start();
    spdlog::info("{} running with provider {}", config_.service_name, to_string(config_.provider()));

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    shutdown();
    spdlog::info("{} run loop finished.", config_.service_name);
}

void Service::stop() {
    running_ = false;
}

void Service::shutdown() {
    if (!server_) {
        return;
    }

    spdlog::info("Stopping {}...", config_.service_name);
    server_->stop();
    orchestrator_->cancel_all();
    orchestrator_.reset();
    server_.reset();

    if (search_client_) {
        search_client_->shutdown();
    }
    model_client_->shutdown();
    model_client_->flush_cache();
    spdlog::info("Response cache flushed ({} entries)", cache_->size());
}
