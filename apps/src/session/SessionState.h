#pragma once

namespace ArcticLink {
namespace Session {

// Derived from what the manager holds; never stored.
enum class SessionState { Unconfigured, AwaitingAuth, Authenticated };

inline const char* toString(SessionState state)
{
    switch (state) {
        case SessionState::Unconfigured:
            return "Unconfigured";
        case SessionState::AwaitingAuth:
            return "AwaitingAuth";
        case SessionState::Authenticated:
            return "Authenticated";
    }
    return "Unknown";
}

} // namespace Session
} // namespace ArcticLink
