#include "openai_provider.hpp"
#include "http_errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

OpenAiProvider::OpenAiProvider(std::string api_key, std::string api_url, ModelCatalog models,
                               int timeout_ms)
    : api_key_(std::move(api_key)),
      api_url_(std::move(api_url)),
      models_(std::move(models)),
      timeout_ms_(timeout_ms) {}

std::string OpenAiProvider::map_model(ModelTier tier) const {
    return models_.model_for(tier);
}

std::string OpenAiProvider::call(const ModelRequest& request) {
    spdlog::debug("OpenAI request: model={}, max_tokens={}", request.model, request.max_tokens);

    nlohmann::json body = {
        {"model", request.model},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", request.prompt}}})},
        {"max_tokens", request.max_tokens},
        {"temperature", 0.3}
    };

    auto response = cpr::Post(
        cpr::Url{api_url_},
        cpr::Header{{"Content-Type", "application/json"},
                    {"Authorization", "Bearer " + api_key_}},
        cpr::Body{body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)},
        cpr::Timeout{timeout_ms_}
    );

    raise_for_response(response, "OpenAI");

    try {
        auto json_res = nlohmann::json::parse(response.text);
        const auto& choices = json_res.at("choices");
        if (!choices.is_array() || choices.empty()) {
            throw UpstreamError(UpstreamError::Kind::InvalidResponse, "OpenAI returned no choices");
        }
        return util::trim(choices[0].at("message").at("content").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw UpstreamError(UpstreamError::Kind::InvalidResponse,
                            std::string("Unexpected OpenAI response: ") + e.what());
    }
}
