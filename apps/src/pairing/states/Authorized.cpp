#include "State.h"
#include "core/LoggingChannels.h"
#include "pairing/PairingCoordinator.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

void Authorized::onEnter(PairingCoordinator& /*coordinator*/)
{
    LOG_INFO(Pairing, "Device paired");
}

Any Authorized::onEvent(const StartPairing& evt, PairingCoordinator& /*coordinator*/)
{
    return Requesting{ .server = evt.server };
}

Any Authorized::onEvent(const Cancel& /*evt*/, PairingCoordinator& /*coordinator*/)
{
    return *this;
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
