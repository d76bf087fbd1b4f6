#include "State.h"
#include "core/LoggingChannels.h"
#include "pairing/PairingApi.h"
#include "pairing/PairingCoordinator.h"
#include "session/SessionManager.h"
#include <algorithm>
#include <cctype>

namespace ArcticLink {
namespace Pairing {
namespace State {

namespace {

using Session::AuthError;

bool mentionsExpiry(std::string message)
{
    std::transform(message.begin(), message.end(), message.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return message.find("expired") != std::string::npos;
}

AuthError classifyRejectedPoll(const Network::HttpResponse& response)
{
    const std::string message = AuthError::serverMessage(response);
    const int status = static_cast<int>(response.status);
    if (mentionsExpiry(message)) {
        return AuthError::make(AuthError::Kind::Expired, message, status);
    }
    if (status == 403) {
        return AuthError::make(AuthError::Kind::Denied, message, status);
    }
    return AuthError::make(AuthError::Kind::ServerRejected, message, status);
}

} // namespace

void Polling::onEnter(PairingCoordinator& coordinator)
{
    const auto now = coordinator.now();
    nextPollAt = now + std::chrono::seconds(session.pollIntervalSeconds);
    lastCountdown = remainingSeconds(now);
    coordinator.emitCountdown(lastCountdown);
}

void Polling::onExit(PairingCoordinator& coordinator)
{
    coordinator.cancelInFlight();
}

int Polling::remainingSeconds(Clock::TimePoint now) const
{
    if (now >= session.expiresAt) {
        return 0;
    }
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(session.expiresAt - now).count();
    return static_cast<int>((ms + 999) / 1000);
}

Any Polling::onEvent(const Tick& evt, PairingCoordinator& coordinator)
{
    if (evt.now >= session.expiresAt) {
        LOG_INFO(Pairing, "Code {} expired after {} poll(s)", session.userCode, session.attempts);
        return Expired{};
    }

    const int remaining = remainingSeconds(evt.now);
    if (remaining != lastCountdown) {
        lastCountdown = remaining;
        coordinator.emitCountdown(remaining);
    }

    if (evt.now >= nextPollAt) {
        if (pollInFlight) {
            LOG_TRACE(Pairing, "Poll still outstanding; skipping tick");
        }
        else {
            pollInFlight = true;
            ++session.attempts;
            nextPollAt = evt.now + std::chrono::seconds(session.pollIntervalSeconds);
            generation = coordinator.sendPoll(server, session.deviceCode);
        }
    }
    return *this;
}

Any Polling::onEvent(const PollCompleted& evt, PairingCoordinator& coordinator)
{
    if (!pollInFlight || evt.generation != generation) {
        LOG_DEBUG(Pairing, "Ignoring stale poll result {}", evt.generation);
        return *this;
    }
    pollInFlight = false;

    if (evt.outcome.isError()) {
        LOG_WARN(Pairing, "Poll failed, will retry: {}", evt.outcome.errorValue().message);
        return *this;
    }

    const auto& response = evt.outcome.value();
    if (!response.isSuccess()) {
        auto error = classifyRejectedPoll(response);
        LOG_WARN(Pairing, "Poll rejected ({}): {}", response.status, error.message);
        return Failed{ .error = std::move(error) };
    }

    auto parsed = parsePollResponse(response.body);
    if (parsed.isError()) {
        return Failed{ .error = AuthError::make(
                           AuthError::Kind::ServerRejected,
                           parsed.errorValue(),
                           static_cast<int>(response.status)) };
    }

    const auto& poll = parsed.value();
    if (poll.status == "pending") {
        LOG_DEBUG(Pairing, "Poll {}: pending", session.attempts);
        return *this;
    }

    if (poll.status == "authorized") {
        if (!poll.accessToken) {
            return Failed{ .error = AuthError::make(
                               AuthError::Kind::ServerRejected,
                               "Authorized without an access token") };
        }
        Session::Credentials credentials{
            .accessToken = poll.accessToken.value(),
            .refreshToken = poll.refreshToken,
        };
        auto stored = coordinator.sessionManager().completePairing(server, credentials);
        if (stored.isError()) {
            return Failed{ .error = stored.errorValue() };
        }
        return Authorized{ .credentials = std::move(credentials) };
    }

    if (poll.status == "expired") {
        return Failed{ .error = AuthError::make(AuthError::Kind::Expired, "Pairing code expired") };
    }
    if (poll.status == "denied") {
        return Failed{ .error = AuthError::make(AuthError::Kind::Denied, "Pairing was denied") };
    }
    return Failed{ .error = AuthError::make(
                       AuthError::Kind::ServerRejected,
                       "Unexpected pairing status '" + poll.status + "'") };
}

Any Polling::onEvent(const Cancel& /*evt*/, PairingCoordinator& /*coordinator*/)
{
    LOG_INFO(Pairing, "Pairing cancelled");
    return Idle{};
}

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
