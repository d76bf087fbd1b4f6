#pragma once

#include "StateForward.h"
#include "pairing/Event.h"
#include "session/ServerConfig.h"
#include <cstdint>

namespace ArcticLink {
namespace Pairing {
namespace State {

// Waiting for POST /pair/request. Retries a bounded number of times.
struct Requesting {
    Session::ServerConfig server;
    int retries = 0;
    uint64_t generation = 0;

    void onEnter(PairingCoordinator& coordinator);
    void onExit(PairingCoordinator& coordinator);

    Any onEvent(const PairRequestCompleted& evt, PairingCoordinator& coordinator);
    Any onEvent(const Cancel& evt, PairingCoordinator& coordinator);

    static constexpr const char* name() { return "Requesting"; }
};

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
