#include "State.h"
#include "core/LoggingChannels.h"
#include "pairing/PairingCoordinator.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

void Idle::onEnter(PairingCoordinator& /*coordinator*/)
{
    LOG_DEBUG(State, "Pairing idle");
}

Any Idle::onEvent(const StartPairing& evt, PairingCoordinator& /*coordinator*/)
{
    LOG_INFO(Pairing, "Starting pairing with {}", evt.server.baseUrl);
    return Requesting{ .server = evt.server };
}

Any Idle::onEvent(const Cancel& /*evt*/, PairingCoordinator& /*coordinator*/)
{
    return *this;
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
