#pragma once

#include "StateForward.h"
#include "pairing/Event.h"
#include "pairing/PairingSession.h"
#include "session/ServerConfig.h"
#include <cstdint>

namespace ArcticLink {
namespace Pairing {
namespace State {

/**
 * @brief Code is on screen; polls /pair/poll every interval until a terminal
 * answer or the expiry deadline.
 *
 * At most one poll is outstanding. A tick that comes due while a poll is
 * still in flight is skipped, not queued.
 */
struct Polling {
    Session::ServerConfig server;
    PairingSession session;
    Clock::TimePoint nextPollAt;
    uint64_t generation = 0;
    bool pollInFlight = false;
    int lastCountdown = -1;

    void onEnter(PairingCoordinator& coordinator);
    void onExit(PairingCoordinator& coordinator);

    Any onEvent(const Tick& evt, PairingCoordinator& coordinator);
    Any onEvent(const PollCompleted& evt, PairingCoordinator& coordinator);
    Any onEvent(const Cancel& evt, PairingCoordinator& coordinator);

    int remainingSeconds(Clock::TimePoint now) const;

    static constexpr const char* name() { return "Polling"; }
};

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
