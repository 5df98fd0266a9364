#pragma once
#include "config.hpp"
#include "provider.hpp"
#include <string>

class AnthropicProvider : public ModelProvider {
public:
    AnthropicProvider(std::string api_key, std::string api_url, std::string api_version,
                      ModelCatalog models, int timeout_ms = 30000);

    std::string call(const ModelRequest& request) override;
    std::string map_model(ModelTier tier) const override;
    Provider provider() const override { return Provider::Anthropic; }

private:
    std::string api_key_;
    std::string api_url_;
    std::string api_version_;
    ModelCatalog models_;
    int timeout_ms_;
};
