#include "cancellation.hpp"
#include "upstream_error.hpp"

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
    return state_->cancelled.load();
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancelledError();
    }
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled.load(); });
}
