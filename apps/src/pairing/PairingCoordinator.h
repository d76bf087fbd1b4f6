#pragma once

#include "Event.h"
#include "EventProcessor.h"
#include "core/CancellationToken.h"
#include "core/Clock.h"
#include "core/Result.h"
#include "core/network/HttpTransport.h"
#include "pairing/states/State.h"
#include "session/AuthError.h"
#include "session/ServerConfig.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace ArcticLink {

class TaskExecutor;

namespace Session {
class SessionManager;
}

namespace Pairing {

/**
 * @brief Device-code pairing: request a code, show it, poll until the server
 * authorizes it or the code runs out.
 *
 * Single-writer: start(), cancel(), update() and the getters belong to the
 * owning thread. HTTP calls run on the executor and report back through the
 * event queue, which update() drains. update() also drives the poll interval,
 * the expiry deadline and the countdown from the injected clock, so it should
 * be called at least a few times per second.
 *
 * The transport must outlive any request the coordinator has posted.
 */
class PairingCoordinator {
public:
    struct Options {
        int requestRetries = 1;
        int defaultIntervalSeconds = 5;
        std::chrono::milliseconds requestTimeout{ 10000 };
        std::string clientName = "ArcticLink";
    };

    // What a pairing screen shows.
    struct Display {
        std::string userCode;
        std::string verificationUrl;
        int remainingSeconds = 0;
        std::string state;
    };

    using CountdownCallback = std::function<void(int remainingSeconds)>;
    using StateChangedCallback = std::function<void(const std::string& stateName)>;

    PairingCoordinator(
        Network::HttpTransport& transport,
        Session::SessionManager& sessionManager,
        TaskExecutor& executor,
        const Clock& clock,
        Options options);
    ~PairingCoordinator();

    PairingCoordinator(const PairingCoordinator&) = delete;
    PairingCoordinator& operator=(const PairingCoordinator&) = delete;

    // Allowed from Idle or a terminal state.
    Result<std::monostate, Session::AuthError> start(const Session::ServerConfig& server);

    // Back to Idle from a non-terminal state. No effect otherwise.
    void cancel();

    void update();

    std::string getCurrentStateName() const;
    bool isTerminal() const;
    Display getDisplay() const;
    std::optional<Session::AuthError> getFailure() const;

    void onCountdown(CountdownCallback callback);
    void onStateChanged(StateChangedCallback callback);

    void handleEvent(const Event& event);

    // Used by the states.
    Clock::TimePoint now() const { return clock_.now(); }
    const Options& options() const { return options_; }
    Session::SessionManager& sessionManager() { return sessionManager_; }
    uint64_t sendPairRequest(const Session::ServerConfig& server);
    uint64_t sendPoll(const Session::ServerConfig& server, const std::string& deviceCode);
    void cancelInFlight();
    void emitCountdown(int remainingSeconds);

private:
    Network::HttpRequest makeRequest(const std::string& url, const std::string& body) const;
    uint64_t dispatch(Network::HttpRequest request, bool isPoll);
    void transitionTo(State::Any newState);

    Network::HttpTransport& transport_;
    Session::SessionManager& sessionManager_;
    TaskExecutor& executor_;
    const Clock& clock_;
    Options options_;

    EventProcessor eventProcessor_;
    State::Any fsmState_{ State::Idle{} };
    uint64_t generation_ = 0;
    CancellationToken inFlight_;

    CountdownCallback countdownCallback_;
    StateChangedCallback stateChangedCallback_;
};

} // namespace Pairing
} // namespace ArcticLink
