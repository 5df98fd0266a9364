#pragma once
#include "config.hpp"
#include "provider.hpp"
#include <string>

class OpenAiProvider : public ModelProvider {
public:
    OpenAiProvider(std::string api_key, std::string api_url, ModelCatalog models,
                   int timeout_ms = 30000);

    std::string call(const ModelRequest& request) override;
    std::string map_model(ModelTier tier) const override;
    Provider provider() const override { return Provider::OpenAI; }

private:
    std::string api_key_;
    std::string api_url_;
    ModelCatalog models_;
    int timeout_ms_;
};
