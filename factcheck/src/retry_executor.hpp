#pragma once
#include "backoff_policy.hpp"
#include "cancellation.hpp"
#include "upstream_error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <functional>

struct RetryInfo {
    int retry_count = 0;
    std::chrono::milliseconds delay{0};
    int max_retries = 0;
};

struct RetryOptions {
    int max_retries = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    // Defaults to retrying every error
    std::function<bool(const std::exception&)> should_retry;
    std::function<void(const std::exception&, const RetryInfo&)> on_retry;
};

// Jittered exponential delay before retry number `retries + 1`
std::chrono::milliseconds retry_delay(const RetryOptions& options, int retries);

// Runs `operation`, retrying failures that `should_retry` accepts until
// `max_retries` retries have been spent. Upstream-agnostic: composes with
// the request queue so a retry re-enqueues the call.
template <typename Operation>
auto retry_with_backoff(Operation&& operation, const RetryOptions& options,
                        const CancellationToken& token = CancellationToken())
    -> decltype(operation()) {
    int retries = 0;

    while (true) {
        token.throw_if_cancelled();
        try {
            return operation();
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            if (retries >= options.max_retries ||
                (options.should_retry && !options.should_retry(e))) {
                throw;
            }

            RetryInfo info;
            info.retry_count = retries + 1;
            info.delay = retry_delay(options, retries);
            info.max_retries = options.max_retries;

            spdlog::info("Retry {}/{} after {}ms: {}", info.retry_count, info.max_retries,
                         info.delay.count(), e.what());

            if (options.on_retry) {
                options.on_retry(e, info);
            }

            if (!token.sleep_for(info.delay)) {
                throw CancelledError("Cancelled while waiting to retry");
            }
            ++retries;
        }
    }
}
