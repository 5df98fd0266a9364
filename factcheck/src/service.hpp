#pragma once

#include "check_server.hpp"
#include "config.hpp"
#include "model_client.hpp"
#include "orchestrator.hpp"
#include "response_cache.hpp"
#include "search_client.hpp"
#include <atomic>
#include <memory>

RequestQueueOptions queue_options_from(const std::string& name, const UpstreamSettings& upstream);
OrchestratorOptions orchestrator_options_from(const Config& config);
ResponseCacheOptions cache_options_from(const Config& config);

// Wires the providers, queues, cache and orchestrator behind the HTTP API
class Service {
public:
    explicit Service(const Config& config);
    ~Service();

    void run();
    void stop();

private:
    void shutdown();

    const Config& config_;
    std::shared_ptr<ResponseCache> cache_;
    std::shared_ptr<ModelClient> model_client_;
    std::shared_ptr<SearchClient> search_client_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::unique_ptr<CheckServer> server_;

    std::atomic<bool> running_{false};
};
