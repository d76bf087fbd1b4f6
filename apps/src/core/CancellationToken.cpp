#include "CancellationToken.h"

namespace ArcticLink {

CancellationToken::CancellationToken() : state_(std::make_shared<State>())
{}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state))
{}

CancellationToken CancellationToken::withTimeout(std::chrono::milliseconds timeout)
{
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    return CancellationToken(std::move(state));
}

void CancellationToken::cancel() const
{
    state_->cancelled.store(true);
}

bool CancellationToken::isCancelled() const
{
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) {
            return true;
        }
    }
    return false;
}

bool CancellationToken::expired() const
{
    const auto limit = deadline();
    return limit.has_value() && Clock::now() >= limit.value();
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const
{
    std::optional<Clock::time_point> earliest;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline.has_value() && (!earliest || s->deadline.value() < earliest.value())) {
            earliest = s->deadline;
        }
    }
    return earliest;
}

CancellationToken CancellationToken::child(std::chrono::milliseconds timeout) const
{
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    state->parent = state_;
    return CancellationToken(std::move(state));
}

CancellationToken CancellationToken::child() const
{
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancellationToken(std::move(state));
}

} // namespace ArcticLink
