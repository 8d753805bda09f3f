#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <memory>

namespace mcpcore {

/// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    [[nodiscard]] bool is_cancelled() const;

    /// Block for up to `timeout`, returning early when cancelled.
    /// Returns true if the token was cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

/// Passed to handlers that want to observe cancellation of their request.
struct RequestContext {
    RequestId id;
    CancellationToken token;

    [[nodiscard]] bool cancelled() const { return token.is_cancelled(); }

    /// Suspension point: throws CancelledError once the request is cancelled.
    void throw_if_cancelled() const;

    /// Sleep that wakes on cancellation; throws CancelledError if cancelled.
    void sleep_for(std::chrono::milliseconds duration) const;
};

} // namespace mcpcore
