#pragma once

#include "StateForward.h"
#include "pairing/Event.h"
#include "session/Credentials.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

// Terminal. Credentials have already been handed to SessionManager.
struct Authorized {
    Session::Credentials credentials;

    void onEnter(PairingCoordinator& coordinator);

    Any onEvent(const StartPairing& evt, PairingCoordinator& coordinator);
    Any onEvent(const Cancel& evt, PairingCoordinator& coordinator);

    static constexpr const char* name() { return "Authorized"; }
};

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
