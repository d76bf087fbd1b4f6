#pragma once

#include <chrono>

namespace ArcticLink {

// Monotonic time source. Injected wherever elapsed time drives a state change.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace ArcticLink
