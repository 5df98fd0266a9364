#include "http_errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

void raise_for_response(const cpr::Response& response, const std::string& upstream) {
    if (response.error) {
        auto kind = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT
            ? UpstreamError::Kind::Timeout
            : UpstreamError::Kind::Network;
        throw UpstreamError(kind, upstream + " request failed: " + response.error.message);
    }

    if (response.status_code >= 200 && response.status_code < 300) {
        return;
    }

    std::optional<std::chrono::seconds> retry_after;
    auto it = response.header.find("Retry-After");
    if (it != response.header.end()) {
        retry_after = parse_retry_after(it->second);
    }

    throw UpstreamError::http(
        static_cast<int>(response.status_code),
        upstream + " error " + std::to_string(response.status_code) + ": " +
            error_message_from_body(response.text),
        retry_after);
}

std::string error_message_from_body(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("error")) {
            const auto& error = parsed["error"];
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                return error["message"].get<std::string>();
            }
            if (error.is_string()) {
                return error.get<std::string>();
            }
        }
        if (parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    }
    return util::truncate_utf8(body, 200);
}
