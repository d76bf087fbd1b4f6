#pragma once

#include "StateForward.h"
#include "pairing/Event.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

// Terminal. The code ran out locally before any terminal poll answer.
struct Expired {
    void onEnter(PairingCoordinator& coordinator);

    Any onEvent(const StartPairing& evt, PairingCoordinator& coordinator);
    Any onEvent(const Cancel& evt, PairingCoordinator& coordinator);

    static constexpr const char* name() { return "Expired"; }
};

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
