#pragma once
#include "types.hpp"
#include <chrono>
#include <exception>
#include <optional>
#include <string>

struct RecoveryStrategy {
    bool retry = false;
    std::chrono::milliseconds wait{0};
    int max_retries = 0;
    std::optional<ModelTier> fallback_model;
    bool reduce_prompt_size = false;
    std::string user_message;
};

struct RecoveryContext {
    Provider provider = Provider::OpenAI;
    ModelTier current_tier = ModelTier::Standard;
    std::string operation = "unknown";
};

namespace error_classifier {

bool is_rate_limit_error(const std::exception& error);
bool is_auth_error(const std::exception& error);
bool is_temporary_error(const std::exception& error);

ErrorCategory categorize(const std::exception& error);

// Fixed strategy per category; a strategy that wants a fallback gets the
// tier to downgrade to from the context.
RecoveryStrategy recovery_for(ErrorCategory category, const RecoveryContext& context = RecoveryContext());

// Premium -> Standard, anything else -> Fast. Fast is a fixed point, so
// repeated downgrades settle within two steps.
ModelTier select_fallback_model(ModelTier current_tier);

std::string user_friendly_message(const std::exception& error, const RecoveryContext& context = RecoveryContext());

void log_error(const std::exception& error, const RecoveryContext& context);

} // namespace error_classifier
