#include "State.h"
#include "core/LoggingChannels.h"
#include "pairing/PairingCoordinator.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

void Failed::onEnter(PairingCoordinator& /*coordinator*/)
{
    LOG_ERROR(Pairing, "Pairing failed ({}): {}", Session::toString(error.kind), error.message);
}

Any Failed::onEvent(const StartPairing& evt, PairingCoordinator& /*coordinator*/)
{
    return Requesting{ .server = evt.server };
}

Any Failed::onEvent(const Cancel& /*evt*/, PairingCoordinator& /*coordinator*/)
{
    return *this;
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
