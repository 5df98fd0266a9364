#include "error_classifier.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace error_classifier {

namespace {

const std::vector<std::string> kRateLimitPhrases = {
    "rate limit", "too many requests", "quota exceeded"
};

const std::vector<std::string> kAuthPhrases = {
    "unauthorized", "authentication", "invalid key", "invalid api key"
};

const std::vector<std::string> kTemporaryPhrases = {
    "timeout", "timed out", "connection", "network", "temporarily", "unavailable", "overloaded"
};

const std::vector<std::string> kContentPolicyPhrases = {
    "content policy", "content filter", "violates", "inappropriate"
};

const std::vector<std::string> kContextLengthPhrases = {
    "context length", "token limit", "too long", "maximum context"
};

std::optional<int> status_of(const std::exception& error) {
    if (auto upstream = dynamic_cast<const UpstreamError*>(&error)) {
        return upstream->status();
    }
    return std::nullopt;
}

// Transport failures are transient by construction, regardless of message
bool is_transport_failure(const std::exception& error) {
    auto upstream = dynamic_cast<const UpstreamError*>(&error);
    if (!upstream) {
        return false;
    }

    switch (upstream->kind()) {
        case UpstreamError::Kind::Network:
        case UpstreamError::Kind::Timeout:
            return true;
        case UpstreamError::Kind::Http:
        case UpstreamError::Kind::InvalidResponse:
            return false;
    }
    return false;
}

} // namespace

bool is_rate_limit_error(const std::exception& error) {
    auto status = status_of(error);
    if (status && *status == 429) {
        return true;
    }
    return util::contains_any_ci(error.what(), kRateLimitPhrases);
}

bool is_auth_error(const std::exception& error) {
    auto status = status_of(error);
    if (status && (*status == 401 || *status == 403)) {
        return true;
    }
    return util::contains_any_ci(error.what(), kAuthPhrases);
}

bool is_temporary_error(const std::exception& error) {
    auto status = status_of(error);
    if (status && *status >= 500) {
        return true;
    }
    if (is_transport_failure(error)) {
        return true;
    }
    return util::contains_any_ci(error.what(), kTemporaryPhrases);
}

ErrorCategory categorize(const std::exception& error) {
    if (is_rate_limit_error(error)) {
        return ErrorCategory::RateLimit;
    }
    if (is_auth_error(error)) {
        return ErrorCategory::AuthError;
    }
    if (is_temporary_error(error)) {
        return ErrorCategory::Temporary;
    }
    if (util::contains_any_ci(error.what(), kContentPolicyPhrases)) {
        return ErrorCategory::ContentPolicy;
    }
    if (util::contains_any_ci(error.what(), kContextLengthPhrases)) {
        return ErrorCategory::ContextLength;
    }
    return ErrorCategory::Unknown;
}

RecoveryStrategy recovery_for(ErrorCategory category, const RecoveryContext& context) {
    RecoveryStrategy strategy;
    bool wants_fallback = false;

    switch (category) {
        case ErrorCategory::RateLimit:
            strategy.retry = true;
            strategy.wait = std::chrono::milliseconds(5000);
            strategy.max_retries = 3;
            strategy.user_message = "Rate limit exceeded. Retrying after a short delay...";
            break;
        case ErrorCategory::Temporary:
            strategy.retry = true;
            strategy.wait = std::chrono::milliseconds(2000);
            strategy.max_retries = 3;
            strategy.user_message = "Temporary error occurred. Retrying...";
            break;
        case ErrorCategory::AuthError:
            strategy.user_message = "Authentication error. Please check your API keys.";
            break;
        case ErrorCategory::ContentPolicy:
            wants_fallback = true;
            strategy.reduce_prompt_size = true;
            strategy.user_message = "Content policy violation. Trying a different approach...";
            break;
        case ErrorCategory::ContextLength:
            strategy.retry = true;
            strategy.max_retries = 1;
            wants_fallback = true;
            strategy.reduce_prompt_size = true;
            strategy.user_message = "Content too long. Reducing size and retrying...";
            break;
        case ErrorCategory::Unknown:
            strategy.retry = true;
            strategy.wait = std::chrono::milliseconds(1000);
            strategy.max_retries = 2;
            wants_fallback = true;
            strategy.user_message = "An error occurred. Trying again...";
            break;
    }

    if (wants_fallback) {
        strategy.fallback_model = select_fallback_model(context.current_tier);
    }

    return strategy;
}

ModelTier select_fallback_model(ModelTier current_tier) {
    if (current_tier == ModelTier::Fast) {
        return ModelTier::Fast;
    }
    if (current_tier == ModelTier::Premium) {
        return ModelTier::Standard;
    }
    return ModelTier::Fast;
}

std::string user_friendly_message(const std::exception& error, const RecoveryContext& context) {
    return recovery_for(categorize(error), context).user_message;
}

void log_error(const std::exception& error, const RecoveryContext& context) {
    auto category = categorize(error);
    auto status = status_of(error);

    spdlog::error("[{}] Error in {} using {}/{} (status {}): {}",
                  to_string(category), context.operation, to_string(context.provider),
                  to_string(context.current_tier), status ? *status : 0,
                  util::truncate_utf8(error.what(), 200));
}

} // namespace error_classifier
