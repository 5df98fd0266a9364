#include "anthropic_provider.hpp"
#include "http_errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

AnthropicProvider::AnthropicProvider(std::string api_key, std::string api_url,
                                     std::string api_version, ModelCatalog models, int timeout_ms)
    : api_key_(std::move(api_key)),
      api_url_(std::move(api_url)),
      api_version_(std::move(api_version)),
      models_(std::move(models)),
      timeout_ms_(timeout_ms) {}

std::string AnthropicProvider::map_model(ModelTier tier) const {
    return models_.model_for(tier);
}

std::string AnthropicProvider::call(const ModelRequest& request) {
    spdlog::debug("Anthropic request: model={}, max_tokens={}", request.model, request.max_tokens);

    nlohmann::json body = {
        {"model", request.model},
        {"max_tokens", request.max_tokens},
        {"temperature", 0.3},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", request.prompt}}})}
    };

    auto response = cpr::Post(
        cpr::Url{api_url_},
        cpr::Header{{"Content-Type", "application/json"},
                    {"x-api-key", api_key_},
                    {"anthropic-version", api_version_}},
        cpr::Body{body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)},
        cpr::Timeout{timeout_ms_}
    );

    raise_for_response(response, "Anthropic");

    try {
        auto json_res = nlohmann::json::parse(response.text);
        const auto& content = json_res.at("content");
        if (!content.is_array() || content.empty() || content[0].value("type", "") != "text") {
            throw UpstreamError(UpstreamError::Kind::InvalidResponse,
                                "Anthropic response carried no text content");
        }
        return util::trim(content[0].at("text").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw UpstreamError(UpstreamError::Kind::InvalidResponse,
                            std::string("Unexpected Anthropic response: ") + e.what());
    }
}
