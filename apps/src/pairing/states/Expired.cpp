#include "State.h"
#include "core/LoggingChannels.h"
#include "pairing/PairingCoordinator.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

void Expired::onEnter(PairingCoordinator& /*coordinator*/)
{
    LOG_WARN(Pairing, "Pairing code expired");
}

Any Expired::onEvent(const StartPairing& evt, PairingCoordinator& /*coordinator*/)
{
    return Requesting{ .server = evt.server };
}

Any Expired::onEvent(const Cancel& /*evt*/, PairingCoordinator& /*coordinator*/)
{
    return *this;
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
