#include "upstream_error.hpp"
#include "util.hpp"

UpstreamError::UpstreamError(Kind kind, const std::string& message,
                             std::optional<int> status,
                             std::optional<std::chrono::seconds> retry_after)
    : std::runtime_error(message),
      kind_(kind),
      status_(status),
      retry_after_(retry_after) {
}

UpstreamError UpstreamError::http(int status, const std::string& message,
                                  std::optional<std::chrono::seconds> retry_after) {
    return UpstreamError(Kind::Http, message, status, retry_after);
}

const char* to_string(UpstreamError::Kind kind) {
    switch (kind) {
        case UpstreamError::Kind::Http: return "http";
        case UpstreamError::Kind::Network: return "network";
        case UpstreamError::Kind::Timeout: return "timeout";
        case UpstreamError::Kind::InvalidResponse: return "invalid_response";
    }
    return "unknown";
}

std::optional<std::chrono::seconds> parse_retry_after(const std::string& header_value) {
    auto value = util::trim(header_value);
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        long seconds = std::stol(value, &consumed);
        if (consumed != value.size() || seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::seconds(seconds);
    } catch (const std::exception&) {
        // HTTP-date form is not used by the providers we talk to
        return std::nullopt;
    }
}
