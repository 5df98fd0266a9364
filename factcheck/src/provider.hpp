#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Capability set of an AI provider. Implementations raise UpstreamError.
class ModelProvider {
public:
    virtual ~ModelProvider() = default;

    virtual std::string call(const ModelRequest& request) = 0;
    virtual std::string map_model(ModelTier tier) const = 0;
    virtual Provider provider() const = 0;
};

// Flat list of evidence for a query. Implementations raise UpstreamError.
class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    virtual std::vector<SearchResult> search(const std::string& query) = 0;
};
