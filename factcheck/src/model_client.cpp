#include "model_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ModelClient::ModelClient(std::shared_ptr<ModelProvider> provider, RequestQueueOptions queue_options,
                         std::shared_ptr<ResponseCache> cache, int extraction_max_tokens)
    : provider_(std::move(provider)),
      cache_(std::move(cache)),
      extraction_max_tokens_(extraction_max_tokens),
      queue_(std::move(queue_options), [p = provider_](const ModelRequest& request) {
          return p->call(request);
      }) {}

ModelClient::~ModelClient() {
    shutdown();
}

std::string ModelClient::call_with_cache(const std::string& prompt, ModelTier tier, int max_tokens,
                                         bool enable_caching, const CancellationToken& token) {
    std::string model = provider_->map_model(tier);

    if (enable_caching && cache_) {
        auto cached = cache_->lookup(prompt, model, max_tokens);
        if (cached) {
            spdlog::debug("Cache hit for {} ({} tier)", model, to_string(tier));
            return *cached;
        }
    }

    ModelRequest request;
    request.prompt = prompt;
    request.model = model;
    request.max_tokens = max_tokens;

    auto future = queue_.enqueue(std::move(request), token);
    std::string response = await_result(future, token);

    if (enable_caching && cache_) {
        cache_->store(prompt, model, max_tokens, response);
    }
    return response;
}

std::string ModelClient::extract_search_query(const std::string& text, const CancellationToken& token) {
    if (text.size() <= kQueryExtractionThreshold) {
        return text;
    }

    std::string prompt =
        "Extract the 2-3 most important factual claims from this text.\n"
        "Focus on specific, verifiable statements rather than opinions.\n"
        "Return ONLY the claims, separated by semicolons, with no additional text:\n\n\"" +
        util::truncate_utf8(text, kExtractionInputLimit) + "\"";

    try {
        auto claims = util::trim(call_with_cache(prompt, ModelTier::Extraction,
                                                 extraction_max_tokens_, true, token));
        if (claims.size() > 10) {
            return claims;
        }
        spdlog::debug("Claim extraction returned too little text, using leading sentences");
        return leading_sentences(text, 3, kQueryExtractionThreshold);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Claim extraction failed: {}", e.what());
        return leading_sentences(text, 2, kQueryExtractionThreshold);
    }
}

std::string ModelClient::model_id(ModelTier tier) const {
    return provider_->map_model(tier);
}

Provider ModelClient::provider() const {
    return provider_->provider();
}

CacheStats ModelClient::cache_stats() const {
    return cache_ ? cache_->stats() : CacheStats{};
}

size_t ModelClient::pending() const {
    return queue_.pending();
}

void ModelClient::flush_cache() {
    if (cache_) {
        cache_->flush();
    }
}

void ModelClient::shutdown() {
    queue_.shutdown();
}

std::string leading_sentences(const std::string& text, size_t count, size_t max_length) {
    std::string joined;
    size_t taken = 0;
    for (const auto& piece : util::split_any(text, ".!?")) {
        auto sentence = util::trim(piece);
        if (sentence.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += ". ";
        }
        joined += sentence;
        if (++taken == count) {
            break;
        }
    }

    if (joined.empty()) {
        return util::truncate_utf8(text, max_length);
    }
    return util::truncate_utf8(joined, max_length);
}
