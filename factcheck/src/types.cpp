#include "types.hpp"
#include "util.hpp"

const char* to_string(ModelTier tier) {
    switch (tier) {
        case ModelTier::Extraction: return "extraction";
        case ModelTier::Fast: return "fast";
        case ModelTier::Standard: return "standard";
        case ModelTier::Premium: return "premium";
    }
    return "unknown";
}

const char* to_string(Provider provider) {
    switch (provider) {
        case Provider::OpenAI: return "openai";
        case Provider::Anthropic: return "anthropic";
    }
    return "unknown";
}

const char* to_string(Complexity complexity) {
    switch (complexity) {
        case Complexity::Low: return "low";
        case Complexity::Medium: return "medium";
        case Complexity::High: return "high";
    }
    return "unknown";
}

const char* to_string(Urgency urgency) {
    switch (urgency) {
        case Urgency::Low: return "low";
        case Urgency::Medium: return "medium";
        case Urgency::High: return "high";
    }
    return "unknown";
}

const char* to_string(Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "High";
        case Confidence::Moderate: return "Moderate";
        case Confidence::Low: return "Low";
    }
    return "Low";
}

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::RateLimit: return "RATE_LIMIT";
        case ErrorCategory::AuthError: return "AUTH_ERROR";
        case ErrorCategory::Temporary: return "TEMPORARY";
        case ErrorCategory::ContentPolicy: return "CONTENT_POLICY";
        case ErrorCategory::ContextLength: return "CONTEXT_LENGTH";
        case ErrorCategory::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(CheckStage stage) {
    switch (stage) {
        case CheckStage::Start: return "start";
        case CheckStage::Search: return "search";
        case CheckStage::Analysis: return "analysis";
        case CheckStage::Verification: return "verification";
        case CheckStage::Retry: return "retry";
        case CheckStage::Fallback: return "fallback";
    }
    return "unknown";
}

std::optional<ModelTier> parse_model_tier(const std::string& value) {
    auto lowered = util::to_lower(util::trim(value));
    if (lowered == "extraction") return ModelTier::Extraction;
    if (lowered == "fast") return ModelTier::Fast;
    if (lowered == "standard") return ModelTier::Standard;
    if (lowered == "premium" || lowered == "advanced") return ModelTier::Premium;
    return std::nullopt;
}

std::optional<Provider> parse_provider(const std::string& value) {
    auto lowered = util::to_lower(util::trim(value));
    if (lowered == "openai") return Provider::OpenAI;
    if (lowered == "anthropic") return Provider::Anthropic;
    return std::nullopt;
}

std::optional<Urgency> parse_urgency(const std::string& value) {
    auto lowered = util::to_lower(util::trim(value));
    if (lowered == "low") return Urgency::Low;
    if (lowered == "medium") return Urgency::Medium;
    if (lowered == "high") return Urgency::High;
    return std::nullopt;
}
