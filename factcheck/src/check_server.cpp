#include "check_server.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

nlohmann::json check_result_json(const CheckResult& result) {
    nlohmann::json out;
    out["result"] = result.result;
    out["queryText"] = result.query_text;
    out["rating"] = result.rating ? nlohmann::json(*result.rating) : nlohmann::json(nullptr);
    out["confidence"] = result.confidence ? nlohmann::json(to_string(*result.confidence)) : nlohmann::json(nullptr);
    out["model"] = result.model;
    out["degraded"] = result.degraded;
    if (result.error_category) {
        out["errorCategory"] = to_string(*result.error_category);
    }
    if (result.retry_after) {
        out["retryAfterMs"] = result.retry_after->count();
    }
    return out;
}

nlohmann::json cache_stats_json(const CacheStats& stats) {
    return {
        {"size", stats.size},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hitRate", stats.hit_rate}
    };
}

std::optional<std::string> parse_check_request(const std::string& body, std::string& error) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        error = "Request body must be a JSON object";
        return std::nullopt;
    }

    if (!parsed.contains("text") || !parsed["text"].is_string()) {
        error = "Field 'text' is required and must be a string";
        return std::nullopt;
    }

    auto text = parsed["text"].get<std::string>();
    if (util::trim(text).empty()) {
        error = "Field 'text' must not be empty";
        return std::nullopt;
    }
    return text;
}

class CheckServer::Impl {
public:
    Impl(const Config& config, Orchestrator& orchestrator, ModelClient& models)
        : config_(config), orchestrator_(orchestrator), models_(models), running_(false) {
        register_routes();
    }

    ~Impl() {
        stop();
    }

    void start() {
        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Check server starting on {}:{}", config_.listen_host, config_.listen_port);
            if (!server_.listen(config_.listen_host.c_str(), config_.listen_port)) {
                spdlog::error("Check server failed to listen on {}:{}", config_.listen_host, config_.listen_port);
            }
        });
    }

    void stop() {
        if (running_.exchange(false)) {
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Check server stopped");
        }
    }

private:
    void register_routes() {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["status"] = "healthy";
            health_status["timestamp"] = util::current_iso8601();
            health_status["pendingChecks"] = orchestrator_.pending_count();
            res.status = 200;
            res.set_content(health_status.dump(2), "application/json");
        });

        server_.Post("/v1/check", [this](const httplib::Request& req, httplib::Response& res) {
            std::string error;
            auto text = parse_check_request(req.body, error);
            if (!text) {
                res.status = 400;
                res.set_content(nlohmann::json{{"error", error}}.dump(), "application/json");
                return;
            }

            auto result = orchestrator_.check(*text);
            res.status = 200;
            // Model output is not guaranteed to be valid UTF-8
            auto body = check_result_json(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            res.set_content(body, "application/json");
        });

        server_.Get("/v1/cache/stats", [this](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content(cache_stats_json(models_.cache_stats()).dump(2), "application/json");
        });

        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "Internal server error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("Unhandled error serving {}: {}", req.path, e.what());
            } catch (...) {
                spdlog::error("Unhandled non-standard error serving {}", req.path);
            }
            res.status = 500;
            res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
        });
    }

    Config config_;
    Orchestrator& orchestrator_;
    ModelClient& models_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

CheckServer::CheckServer(const Config& config, Orchestrator& orchestrator, ModelClient& models)
    : pImpl_(std::make_unique<Impl>(config, orchestrator, models)) {}

CheckServer::~CheckServer() = default;

void CheckServer::start() {
    pImpl_->start();
}

void CheckServer::stop() {
    pImpl_->stop();
}
