#pragma once
#include "backoff_policy.hpp"
#include "cancellation.hpp"
#include "rate_limiter.hpp"
#include "upstream_error.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

struct RequestQueueOptions {
    std::string name = "default";
    int rate_limit_per_minute = 0;
    BackoffPolicy backoff;
    // How long to wait before re-checking a saturated rate window
    std::chrono::milliseconds rate_limit_poll{1000};
};

// FIFO dispatcher for one upstream service. A single worker serializes
// calls, honours the per-minute window, backs off after failures and
// re-delivers requests rejected with HTTP 429 at the head of the queue.
template <typename Payload, typename Result>
class RequestQueue {
public:
    using Handler = std::function<Result(const Payload&)>;

    RequestQueue(RequestQueueOptions options, Handler handler)
        : options_(std::move(options)),
          handler_(std::move(handler)),
          limiter_(options_.rate_limit_per_minute) {
        worker_ = std::thread([this]() { drain_loop(); });
    }

    ~RequestQueue() {
        shutdown();
    }

    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    std::future<Result> enqueue(Payload payload, CancellationToken token = CancellationToken()) {
        QueuedRequest request;
        request.payload = std::move(payload);
        request.token = std::move(token);
        request.enqueue_time = std::chrono::steady_clock::now();
        auto future = request.promise.get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                request.promise.set_exception(std::make_exception_ptr(
                    CancelledError("Request queue '" + options_.name + "' is shut down")));
                return future;
            }
            request.id = ++next_id_;
            queue_.push_back(std::move(request));
        }
        // Wakes the worker if it is idle; a draining worker re-checks the
        // queue under the same mutex before going idle, so no wakeup is lost.
        cv_.notify_one();
        return future;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }
        shutdown_token_.cancel();
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    int consecutive_errors() const {
        return consecutive_errors_.load();
    }

    const std::string& name() const {
        return options_.name;
    }

private:
    struct QueuedRequest {
        uint64_t id = 0;
        Payload payload;
        std::chrono::steady_clock::time_point enqueue_time;
        std::promise<Result> promise;
        CancellationToken token;
    };

    void drain_loop() {
        std::unique_lock<std::mutex> lock(mutex_);

        while (true) {
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }

            draining_ = true;
            spdlog::debug("[{}] Draining {} queued request(s)", options_.name, queue_.size());

            while (!queue_.empty() && !stopping_) {
                if (!limiter_.allow()) {
                    lock.unlock();
                    spdlog::debug("[{}] Rate limit of {}/min reached, waiting", options_.name, limiter_.limit());
                    shutdown_token_.sleep_for(options_.rate_limit_poll);
                    lock.lock();
                    continue;
                }

                int errors = consecutive_errors_.load();
                auto current_backoff = options_.backoff.delay(errors);
                if (errors > 0) {
                    lock.unlock();
                    spdlog::debug("[{}] Backing off {} ms after {} consecutive error(s)",
                                  options_.name, current_backoff.count(), errors);
                    bool completed = shutdown_token_.sleep_for(current_backoff);
                    lock.lock();
                    if (!completed || queue_.empty()) {
                        continue;
                    }
                }

                QueuedRequest request = std::move(queue_.front());
                queue_.pop_front();

                if (request.token.is_cancelled()) {
                    lock.unlock();
                    spdlog::debug("[{}] Dropping cancelled request #{}", options_.name, request.id);
                    request.promise.set_exception(std::make_exception_ptr(CancelledError()));
                    lock.lock();
                    continue;
                }

                limiter_.record();
                lock.unlock();
                dispatch(request, current_backoff);
                lock.lock();
            }

            draining_ = false;
        }

        // Fail whatever is still waiting so no caller blocks forever
        while (!queue_.empty()) {
            QueuedRequest request = std::move(queue_.front());
            queue_.pop_front();
            request.promise.set_exception(std::make_exception_ptr(
                CancelledError("Request queue '" + options_.name + "' shut down before dispatch")));
        }
        draining_ = false;
    }

    // Runs the upstream call without holding the queue mutex
    void dispatch(QueuedRequest& request, std::chrono::milliseconds current_backoff) {
        try {
            Result result = handler_(request.payload);
            consecutive_errors_ = 0;
            request.promise.set_value(std::move(result));
        } catch (const UpstreamError& e) {
            if (e.status() && *e.status() == 429) {
                int errors = ++consecutive_errors_;
                auto wait = e.retry_after()
                    ? std::chrono::duration_cast<std::chrono::milliseconds>(*e.retry_after())
                    : current_backoff * 2;
                spdlog::warn("[{}] Request #{} rate limited (429), re-queued at head; waiting {} ms ({} consecutive)",
                             options_.name, request.id, wait.count(), errors);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    queue_.push_front(std::move(request));
                }
                shutdown_token_.sleep_for(wait);
                return;
            }
            ++consecutive_errors_;
            spdlog::warn("[{}] Request #{} failed: {}", options_.name, request.id, e.what());
            request.promise.set_exception(std::current_exception());
        } catch (const std::exception& e) {
            ++consecutive_errors_;
            spdlog::warn("[{}] Request #{} failed: {}", options_.name, request.id, e.what());
            request.promise.set_exception(std::current_exception());
        } catch (...) {
            ++consecutive_errors_;
            spdlog::warn("[{}] Request #{} failed with a non-standard exception", options_.name, request.id);
            request.promise.set_exception(std::current_exception());
        }
    }

    RequestQueueOptions options_;
    Handler handler_;
    RateLimiter limiter_;
    CancellationToken shutdown_token_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<QueuedRequest> queue_;
    uint64_t next_id_ = 0;
    bool stopping_ = false;
    std::atomic<bool> draining_{false};
    std::atomic<int> consecutive_errors_{0};
    std::thread worker_;
};

// Blocks on a queued result, giving up with CancelledError once the token
// fires. A request still waiting in the queue is then dropped at dispatch.
template <typename Result>
Result await_result(std::future<Result>& future, const CancellationToken& token,
                    std::chrono::milliseconds poll = std::chrono::milliseconds(50)) {
    while (future.wait_for(poll) != std::future_status::ready) {
        token.throw_if_cancelled();
    }
    return future.get();
}
