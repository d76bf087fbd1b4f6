#include "PairingCoordinator.h"
#include "UserCode.h"
#include "core/LoggingChannels.h"
#include "core/TaskExecutor.h"
#include "session/SessionManager.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Pairing {

PairingCoordinator::PairingCoordinator(
    Network::HttpTransport& transport,
    Session::SessionManager& sessionManager,
    TaskExecutor& executor,
    const Clock& clock,
    Options options)
    : transport_(transport),
      sessionManager_(sessionManager),
      executor_(executor),
      clock_(clock),
      options_(std::move(options))
{}

PairingCoordinator::~PairingCoordinator()
{
    cancelInFlight();
}

Result<std::monostate, Session::AuthError> PairingCoordinator::start(
    const Session::ServerConfig& server)
{
    using R = Result<std::monostate, Session::AuthError>;

    if (!server.validated) {
        return R::error(Session::AuthError::make(
            Session::AuthError::Kind::NotConfigured, "Pairing needs a validated server"));
    }
    if (!State::isState<State::Idle>(fsmState_) && !isTerminal()) {
        return R::error(Session::AuthError::make(
            Session::AuthError::Kind::ServerRejected,
            "Pairing already in progress (" + getCurrentStateName() + ")"));
    }

    // Results still queued from an earlier attempt are stale by now.
    eventProcessor_.clearQueue();
    handleEvent(StartPairing{ .server = server });
    return R::okay(std::monostate{});
}

void PairingCoordinator::cancel()
{
    handleEvent(Cancel{});
}

void PairingCoordinator::update()
{
    eventProcessor_.processEventsFromQueue(*this);
    handleEvent(Tick{ .now = clock_.now() });
    // An inline executor may already have answered a poll the tick issued.
    eventProcessor_.processEventsFromQueue(*this);
}

std::string PairingCoordinator::getCurrentStateName() const
{
    return State::getCurrentStateName(fsmState_);
}

bool PairingCoordinator::isTerminal() const
{
    return State::isTerminal(fsmState_);
}

PairingCoordinator::Display PairingCoordinator::getDisplay() const
{
    Display display;
    display.state = getCurrentStateName();
    if (const auto* polling = std::get_if<State::Polling>(&fsmState_.getVariant())) {
        display.userCode = formatUserCode(polling->session.userCode);
        display.verificationUrl = polling->session.verificationUrl;
        display.remainingSeconds = polling->remainingSeconds(clock_.now());
    }
    return display;
}

std::optional<Session::AuthError> PairingCoordinator::getFailure() const
{
    if (const auto* failed = std::get_if<State::Failed>(&fsmState_.getVariant())) {
        return failed->error;
    }
    return std::nullopt;
}

void PairingCoordinator::onCountdown(CountdownCallback callback)
{
    countdownCallback_ = std::move(callback);
}

void PairingCoordinator::onStateChanged(StateChangedCallback callback)
{
    stateChangedCallback_ = std::move(callback);
}

void PairingCoordinator::handleEvent(const Event& event)
{
    std::visit(
        [this](auto&& evt) {
            std::visit(
                [this, &evt](auto&& state) -> void {
                    using StateType = std::decay_t<decltype(state)>;

                    if constexpr (requires { state.onEvent(evt, *this); }) {
                        auto newState = state.onEvent(evt, *this);
                        if (!std::holds_alternative<StateType>(newState.getVariant())) {
                            transitionTo(std::move(newState));
                        }
                        else {
                            fsmState_ = std::move(newState);
                        }
                    }
                    else {
                        LOG_TRACE(
                            State,
                            "{} ignores {}",
                            State::getCurrentStateName(fsmState_),
                            std::decay_t<decltype(evt)>::name());
                    }
                },
                fsmState_.getVariant());
        },
        event.getVariant());
}

uint64_t PairingCoordinator::sendPairRequest(const Session::ServerConfig& server)
{
    return dispatch(makeRequest(server.baseUrl + "/pair/request", "{}"), false);
}

uint64_t PairingCoordinator::sendPoll(
    const Session::ServerConfig& server, const std::string& deviceCode)
{
    const nlohmann::json body{ { "device_code", deviceCode } };
    return dispatch(makeRequest(server.baseUrl + "/pair/poll", body.dump()), true);
}

void PairingCoordinator::cancelInFlight()
{
    inFlight_.cancel();
}

void PairingCoordinator::emitCountdown(int remainingSeconds)
{
    if (countdownCallback_) {
        countdownCallback_(remainingSeconds);
    }
}

Network::HttpRequest PairingCoordinator::makeRequest(
    const std::string& url, const std::string& body) const
{
    Network::HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.body = body;
    request.timeout = options_.requestTimeout;
    request.headers["Accept"] = "application/json";
    request.headers["Content-Type"] = "application/json";
    request.headers["X-Client-Name"] = options_.clientName;
    return request;
}

uint64_t PairingCoordinator::dispatch(Network::HttpRequest request, bool isPoll)
{
    const uint64_t generation = ++generation_;
    inFlight_ = CancellationToken{};
    const CancellationToken token = inFlight_.child(options_.requestTimeout);

    executor_.post([queue = eventProcessor_.sharedQueue(),
                    &transport = transport_,
                    request = std::move(request),
                    token,
                    generation,
                    isPoll] {
        auto outcome = transport.send(request, token);
        if (isPoll) {
            EventProcessor::post(
                *queue, PollCompleted{ .generation = generation, .outcome = std::move(outcome) });
        }
        else {
            EventProcessor::post(
                *queue,
                PairRequestCompleted{ .generation = generation, .outcome = std::move(outcome) });
        }
    });
    return generation;
}

void PairingCoordinator::transitionTo(State::Any newState)
{
    const std::string oldStateName = getCurrentStateName();

    State::exitState(fsmState_, *this);
    fsmState_ = std::move(newState);

    const std::string newStateName = getCurrentStateName();
    LOG_INFO(State, "Pairing: {} -> {}", oldStateName, newStateName);

    State::enterState(fsmState_, *this);

    if (stateChangedCallback_) {
        stateChangedCallback_(newStateName);
    }
}

} // namespace Pairing
} // namespace ArcticLink
