#pragma once

#include "AuthError.h"
#include "CredentialStore.h"
#include "SessionState.h"
#include "core/CancellationToken.h"
#include "core/Result.h"
#include "core/network/HttpTransport.h"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace ArcticLink {
namespace Session {

/**
 * @brief Single owner of the server config, credentials and cached profile.
 *
 * Collaborators that need a bearer token ask this object for it; nothing else
 * reads the store. Every store write happens under one mutex, so login,
 * pairing and reset never interleave their writes. HTTP calls run outside the
 * lock.
 */
class SessionManager {
public:
    struct Options {
        std::chrono::milliseconds requestTimeout{ 10000 };
        std::string clientName = "ArcticLink";
    };

    SessionManager(Network::HttpTransport& transport, CredentialStore& store, Options options);
    SessionManager(Network::HttpTransport& transport, CredentialStore& store);

    // Reads the store into memory. A corrupt store is logged and treated as empty.
    void loadPersisted();

    // Persists a validated config. A different baseUrl drops credentials and profile.
    Result<std::monostate, AuthError> setServerConfig(const ServerConfig& config);

    Result<UserProfile, AuthError> login(
        const std::string& identifier,
        const std::string& password,
        const CancellationToken& token = CancellationToken{});

    // Always clears credentials locally; the server call is best-effort.
    void logout(const CancellationToken& token = CancellationToken{});

    // One /auth/me attempt. Never reports an error; failures degrade to AwaitingAuth.
    SessionState checkAuth(const CancellationToken& token = CancellationToken{});

    // Full reset: config, credentials and profile go together.
    void clearServerConfig();

    // issuer is the server that granted the credentials; they are refused if
    // the current config points elsewhere.
    Result<std::monostate, AuthError> completePairing(
        const ServerConfig& issuer, const Credentials& credentials);

    Result<std::monostate, AuthError> activatePairingCode(
        const std::string& userCode, const CancellationToken& token = CancellationToken{});

    std::optional<std::string> authorizationHeader() const;
    void reportUnauthorized();

    SessionState getState() const;
    std::optional<ServerConfig> getServerConfig() const;
    std::optional<UserProfile> getUserProfile() const;

private:
    Network::HttpRequest makeRequest(
        const std::string& method, const std::string& url, const std::string& body = "") const;

    // Caller holds mutex_.
    void persistLocked();
    void clearCredentialsLocked();

    Network::HttpTransport& transport_;
    CredentialStore& store_;
    Options options_;

    mutable std::mutex mutex_;
    StoredSession session_;
    bool verified_ = false;
};

} // namespace Session
} // namespace ArcticLink
