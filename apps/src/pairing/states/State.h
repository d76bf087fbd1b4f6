#pragma once

#include "Authorized.h"
#include "Expired.h"
#include "Failed.h"
#include "Idle.h"
#include "Polling.h"
#include "Requesting.h"
#include "StateForward.h"

#include <string>
#include <variant>

namespace ArcticLink {
namespace Pairing {
namespace State {

class Any {
public:
    using Variant = std::variant<Idle, Requesting, Polling, Authorized, Expired, Failed>;

    template <typename T>
    Any(T&& state) : variant_(std::forward<T>(state))
    {}

    Any() = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getCurrentStateName(const Any& state)
{
    return std::visit([](const auto& s) { return std::string(s.name()); }, state.getVariant());
}

template <typename S>
bool isState(const Any& state)
{
    return std::holds_alternative<S>(state.getVariant());
}

inline void enterState(Any& state, PairingCoordinator& coordinator)
{
    std::visit(
        [&](auto& active) {
            if constexpr (requires { active.onEnter(coordinator); }) {
                active.onEnter(coordinator);
            }
        },
        state.getVariant());
}

inline void exitState(Any& state, PairingCoordinator& coordinator)
{
    std::visit(
        [&](auto& active) {
            if constexpr (requires { active.onExit(coordinator); }) {
                active.onExit(coordinator);
            }
        },
        state.getVariant());
}

inline bool isTerminal(const Any& state)
{
    return std::holds_alternative<Authorized>(state.getVariant())
        || std::holds_alternative<Expired>(state.getVariant())
        || std::holds_alternative<Failed>(state.getVariant());
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
