#include "retry_executor.hpp"

std::chrono::milliseconds retry_delay(const RetryOptions& options, int retries) {
    BackoffPolicy policy(options.initial_delay, 2.0, options.max_delay);
    return policy.jittered_delay(retries);
}
