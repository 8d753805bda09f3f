#include "mcpcore/cancellation.hpp"
#include "mcpcore/error.hpp"
#include <condition_variable>
#include <mutex>

namespace mcpcore {

struct CancellationToken::State {
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    bool cancelled = false;
};

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
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

void RequestContext::throw_if_cancelled() const {
    if (token.is_cancelled()) {
        throw CancelledError();
    }
}

void RequestContext::sleep_for(std::chrono::milliseconds duration) const {
    if (token.wait_for(duration)) {
        throw CancelledError();
    }
}

} // namespace mcpcore
