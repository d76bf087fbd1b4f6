#pragma once

#include "StateForward.h"
#include "pairing/Event.h"
#include "session/AuthError.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

struct Failed {
    Session::AuthError error;

    void onEnter(PairingCoordinator& coordinator);

    Any onEvent(const StartPairing& evt, PairingCoordinator& coordinator);
    Any onEvent(const Cancel& evt, PairingCoordinator& coordinator);

    static constexpr const char* name() { return "Failed"; }
};

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
