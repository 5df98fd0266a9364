#pragma once
#include "cancellation.hpp"
#include "provider.hpp"
#include "request_queue.hpp"
#include "response_cache.hpp"
#include <memory>
#include <string>

// Provider-agnostic model access: every call goes through one rate limited
// queue and is memoized in the response cache.
class ModelClient {
public:
    ModelClient(std::shared_ptr<ModelProvider> provider, RequestQueueOptions queue_options,
                std::shared_ptr<ResponseCache> cache, int extraction_max_tokens = 300);
    ~ModelClient();

    std::string call_with_cache(const std::string& prompt, ModelTier tier, int max_tokens,
                                bool enable_caching, const CancellationToken& token = CancellationToken());

    // Inputs longer than kQueryExtractionThreshold are condensed to their main
    // claims by the extraction tier; shorter inputs are used as-is.
    std::string extract_search_query(const std::string& text,
                                     const CancellationToken& token = CancellationToken());

    std::string model_id(ModelTier tier) const;
    Provider provider() const;
    CacheStats cache_stats() const;
    size_t pending() const;
    void flush_cache();
    void shutdown();

    static constexpr size_t kQueryExtractionThreshold = 300;
    static constexpr size_t kExtractionInputLimit = 2000;

private:
    std::shared_ptr<ModelProvider> provider_;
    std::shared_ptr<ResponseCache> cache_;
    int extraction_max_tokens_;
    RequestQueue<ModelRequest, std::string> queue_;
};

// First `count` sentences of `text`, joined and clipped to `max_length`
std::string leading_sentences(const std::string& text, size_t count, size_t max_length);
