#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Copyable handle onto shared cancellation state. Copies observe and
// trigger the same cancellation.
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool is_cancelled() const;
    void throw_if_cancelled() const;

    // Sleeps for the given duration; returns false if woken by cancel().
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};
