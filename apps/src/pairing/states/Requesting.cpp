#include "State.h"
#include "core/LoggingChannels.h"
#include "pairing/PairingApi.h"
#include "pairing/PairingCoordinator.h"
#include "pairing/UserCode.h"

namespace ArcticLink {
namespace Pairing {
namespace State {

void Requesting::onEnter(PairingCoordinator& coordinator)
{
    generation = coordinator.sendPairRequest(server);
}

void Requesting::onExit(PairingCoordinator& coordinator)
{
    coordinator.cancelInFlight();
}

Any Requesting::onEvent(const PairRequestCompleted& evt, PairingCoordinator& coordinator)
{
    if (evt.generation != generation) {
        LOG_DEBUG(Pairing, "Ignoring stale pair request result {}", evt.generation);
        return *this;
    }

    Session::AuthError error;
    if (evt.outcome.isError()) {
        error = Session::AuthError::fromHttpError(evt.outcome.errorValue());
    }
    else if (!evt.outcome.value().isSuccess()) {
        error = Session::AuthError::fromResponse(evt.outcome.value());
    }
    else {
        auto parsed = parsePairRequestResponse(evt.outcome.value().body);
        if (parsed.isValue()) {
            const auto& response = parsed.value();
            int interval = response.interval;
            if (interval <= 0) {
                interval = coordinator.options().defaultIntervalSeconds;
            }

            PairingSession session{
                .deviceCode = response.deviceCode,
                .userCode = response.userCode,
                .verificationUrl =
                    (response.serverUrl.empty() ? server.baseUrl : response.serverUrl) + "/pair",
                .pollIntervalSeconds = interval,
                .expiresAt = coordinator.now() + std::chrono::seconds(response.expiresIn),
                .attempts = 0,
            };
            LOG_INFO(
                Pairing,
                "Enter code {} at {} (expires in {}s, polling every {}s)",
                formatUserCode(session.userCode),
                session.verificationUrl,
                response.expiresIn,
                interval);
            return Polling{ .server = server, .session = std::move(session) };
        }
        error = Session::AuthError::make(
            Session::AuthError::Kind::ServerRejected,
            parsed.errorValue(),
            static_cast<int>(evt.outcome.value().status));
    }

    if (retries < coordinator.options().requestRetries) {
        ++retries;
        LOG_WARN(Pairing, "Pair request failed ({}); retry {}", error.message, retries);
        generation = coordinator.sendPairRequest(server);
        return *this;
    }

    LOG_ERROR(Pairing, "Pair request failed: {}", error.message);
    return Failed{ .error = std::move(error) };
}

Any Requesting::onEvent(const Cancel& /*evt*/, PairingCoordinator& /*coordinator*/)
{
    LOG_INFO(Pairing, "Pairing cancelled while requesting a code");
    return Idle{};
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
