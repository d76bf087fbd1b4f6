#pragma once

#include "StateForward.h"
#include "pairing/Event.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

struct Idle {
    void onEnter(PairingCoordinator& coordinator);

    Any onEvent(const StartPairing& evt, PairingCoordinator& coordinator);
    Any onEvent(const Cancel& evt, PairingCoordinator& coordinator);

    static constexpr const char* name() { return "Idle"; }
};

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
