#pragma once
#include "config.hpp"
#include "model_client.hpp"
#include "orchestrator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

// Inbound HTTP API: health, fact checks and cache statistics
class CheckServer {
public:
    CheckServer(const Config& config, Orchestrator& orchestrator, ModelClient& models);
    ~CheckServer();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

nlohmann::json check_result_json(const CheckResult& result);
nlohmann::json cache_stats_json(const CacheStats& stats);

// Text to check from a POST /v1/check body; sets `error` and returns
// nullopt on malformed JSON or a missing/blank "text" field
std::optional<std::string> parse_check_request(const std::string& body, std::string& error);
