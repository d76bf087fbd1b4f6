#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace ArcticLink {

/**
 * @brief Copyable handle to shared cancellation state with an optional deadline.
 *
 * Copies observe the same state. A child token aborts when its parent is
 * cancelled or expires, or when its own deadline passes; cancelling a child
 * never affects the parent.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();

    static CancellationToken withTimeout(std::chrono::milliseconds timeout);

    void cancel() const;
    bool isCancelled() const;
    bool expired() const;

    // True once cancelled or past any deadline in the chain.
    bool shouldAbort() const { return isCancelled() || expired(); }

    // Earliest deadline across this token and its ancestors.
    std::optional<Clock::time_point> deadline() const;

    CancellationToken child(std::chrono::milliseconds timeout) const;
    CancellationToken child() const;

private:
    struct State {
        std::atomic<bool> cancelled{ false };
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace ArcticLink
