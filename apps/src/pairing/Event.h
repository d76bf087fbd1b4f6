#pragma once

#include "core/Clock.h"
#include "core/Result.h"
#include "core/network/HttpTypes.h"
#include "session/ServerConfig.h"
#include <concepts>
#include <cstdint>
#include <string>
#include <variant>

namespace ArcticLink {
namespace Pairing {

template <typename T>
concept HasEventName = requires {
    { T::name() } -> std::convertible_to<const char*>;
};

using HttpOutcome = Result<Network::HttpResponse, Network::HttpError>;

struct StartPairing {
    Session::ServerConfig server;
    static constexpr const char* name() { return "StartPairing"; }
};

struct Cancel {
    static constexpr const char* name() { return "Cancel"; }
};

// Emitted by update() on every pass of the owner's loop.
struct Tick {
    Clock::TimePoint now;
    static constexpr const char* name() { return "Tick"; }
};

// generation identifies the request; results for superseded requests are ignored.
struct PairRequestCompleted {
    uint64_t generation = 0;
    HttpOutcome outcome;
    static constexpr const char* name() { return "PairRequestCompleted"; }
};

struct PollCompleted {
    uint64_t generation = 0;
    HttpOutcome outcome;
    static constexpr const char* name() { return "PollCompleted"; }
};

class Event {
public:
    using Variant = std::variant<StartPairing, Cancel, Tick, PairRequestCompleted, PollCompleted>;

    template <typename T>
    Event(T&& event) : variant_(std::forward<T>(event))
    {}

    Event() = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getEventName(const Event& event)
{
    return std::visit([](auto&& e) { return std::string(e.name()); }, event.getVariant());
}

} // namespace Pairing
} // namespace ArcticLink
