#include "SessionManager.h"
#include "core/LoggingChannels.h"
#include "pairing/UserCode.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Session {

namespace {

using Okay = Result<std::monostate, AuthError>;

std::optional<UserProfile> parseProfile(const nlohmann::json& body)
{
    const nlohmann::json& source =
        body.is_object() && body.contains("user") && body["user"].is_object() ? body["user"]
                                                                               : body;
    try {
        return source.get<UserProfile>();
    }
    catch (const nlohmann::json::exception& e) {
        LOG_WARN(Session, "Unusable user object: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> stringField(const nlohmann::json& body, const char* key)
{
    if (body.contains(key) && body[key].is_string() && !body[key].get<std::string>().empty()) {
        return body[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

SessionManager::SessionManager(
    Network::HttpTransport& transport, CredentialStore& store, Options options)
    : transport_(transport), store_(store), options_(std::move(options))
{}

SessionManager::SessionManager(Network::HttpTransport& transport, CredentialStore& store)
    : SessionManager(transport, store, Options{})
{}

void SessionManager::loadPersisted()
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = store_.load();
    if (loaded.isError()) {
        LOG_ERROR(Storage, "Ignoring stored session: {}", loaded.errorValue().message);
        session_ = StoredSession{};
        verified_ = false;
        return;
    }

    session_ = loaded.value();
    if (session_.server && !session_.server->validated) {
        LOG_WARN(Session, "Stored server {} was never validated", session_.server->baseUrl);
        session_ = StoredSession{};
    }
    verified_ = false;
    LOG_INFO(
        Session,
        "Loaded session: server={}, credentials={}",
        session_.server ? session_.server->baseUrl : "<none>",
        session_.credentials.has_value());
}

Result<std::monostate, AuthError> SessionManager::setServerConfig(const ServerConfig& config)
{
    if (!config.validated) {
        return Okay::error(
            AuthError::make(AuthError::Kind::NotConfigured, "Server config is not validated"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.server && session_.server->baseUrl != config.baseUrl) {
        LOG_INFO(Session, "Server changed {} -> {}", session_.server->baseUrl, config.baseUrl);
        session_.credentials.reset();
        session_.user.reset();
        verified_ = false;
    }
    session_.server = config;
    persistLocked();
    return Okay::okay(std::monostate{});
}

Result<UserProfile, AuthError> SessionManager::login(
    const std::string& identifier, const std::string& password, const CancellationToken& token)
{
    using R = Result<UserProfile, AuthError>;

    std::optional<ServerConfig> server = getServerConfig();
    if (!server || !server->validated) {
        return R::error(AuthError::make(AuthError::Kind::NotConfigured, "No validated server"));
    }

    const nlohmann::json body{ { "identifier", identifier }, { "password", password } };
    auto request = makeRequest("POST", server->apiBase + "/auth/login", body.dump());

    LOG_INFO(Session, "Logging in as '{}' at {}", identifier, server->baseUrl);
    const auto result = transport_.send(request, token.child(options_.requestTimeout));
    if (result.isError()) {
        auto error = AuthError::fromHttpError(result.errorValue());
        LOG_WARN(Session, "Login failed: {}", error.message);
        return R::error(std::move(error));
    }
    if (token.isCancelled()) {
        return R::error(AuthError::make(AuthError::Kind::Cancelled, "Login cancelled"));
    }

    const auto& response = result.value();
    if (!response.isSuccess()) {
        // A rejected password is not an authenticated-call 401.
        auto error = AuthError::make(
            AuthError::Kind::ServerRejected,
            AuthError::serverMessage(response),
            static_cast<int>(response.status));
        LOG_WARN(Session, "Login rejected ({}): {}", response.status, error.message);
        return R::error(std::move(error));
    }

    const auto json = nlohmann::json::parse(response.body, nullptr, false);
    const auto accessToken = json.is_object() ? stringField(json, "token") : std::nullopt;
    const auto fallbackToken = json.is_object() ? stringField(json, "access_token") : std::nullopt;
    const auto profile = json.is_object() ? parseProfile(json) : std::nullopt;
    if ((!accessToken && !fallbackToken) || !profile) {
        return R::error(AuthError::make(
            AuthError::Kind::ServerRejected,
            "Malformed login response",
            static_cast<int>(response.status)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.server || session_.server->baseUrl != server->baseUrl) {
        return R::error(
            AuthError::make(AuthError::Kind::NotConfigured, "Server changed during login"));
    }
    session_.credentials = Credentials{
        .accessToken = accessToken ? accessToken.value() : fallbackToken.value(),
        .refreshToken = stringField(json, "refresh_token"),
    };
    session_.user = profile;
    verified_ = true;
    persistLocked();

    LOG_INFO(
        Session,
        "Authenticated as {} (token {})",
        profile->username,
        LoggingChannels::redact(session_.credentials->accessToken));
    return R::okay(profile.value());
}

void SessionManager::logout(const CancellationToken& token)
{
    std::optional<ServerConfig> server;
    std::optional<Credentials> credentials;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = session_.server;
        credentials = session_.credentials;
    }

    if (server && credentials) {
        auto request = makeRequest("POST", server->apiBase + "/auth/logout");
        request.headers["Authorization"] = "Bearer " + credentials->accessToken;
        const auto result = transport_.send(request, token.child(options_.requestTimeout));
        if (result.isError()) {
            LOG_WARN(Session, "Server logout failed: {}", result.errorValue().message);
        }
        else if (!result.value().isSuccess()) {
            LOG_WARN(Session, "Server logout returned HTTP {}", result.value().status);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    clearCredentialsLocked();
    persistLocked();
    LOG_INFO(Session, "Logged out");
}

SessionState SessionManager::checkAuth(const CancellationToken& token)
{
    std::optional<ServerConfig> server;
    std::optional<Credentials> credentials;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = session_.server;
        credentials = session_.credentials;
    }

    if (!server) {
        return SessionState::Unconfigured;
    }
    if (!credentials) {
        return SessionState::AwaitingAuth;
    }

    auto request = makeRequest("GET", server->apiBase + "/auth/me");
    request.headers["Authorization"] = "Bearer " + credentials->accessToken;
    const auto result = transport_.send(request, token.child(options_.requestTimeout));

    if (result.isError() && result.errorValue().kind == Network::HttpError::Kind::Cancelled) {
        LOG_INFO(Session, "checkAuth cancelled; stored credentials kept");
        return getState();
    }

    std::optional<UserProfile> profile;
    if (result.isError()) {
        LOG_WARN(Session, "checkAuth transport failure: {}", result.errorValue().message);
    }
    else if (!result.value().isSuccess()) {
        LOG_WARN(Session, "checkAuth rejected with HTTP {}", result.value().status);
    }
    else {
        profile = parseProfile(nlohmann::json::parse(result.value().body, nullptr, false));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.credentials != credentials) {
        // Credentials changed while the request was in flight; that change wins.
        return session_.server && session_.credentials && verified_
            ? SessionState::Authenticated
            : (session_.server ? SessionState::AwaitingAuth : SessionState::Unconfigured);
    }

    if (!profile) {
        clearCredentialsLocked();
        persistLocked();
        return SessionState::AwaitingAuth;
    }

    session_.user = profile;
    verified_ = true;
    persistLocked();
    LOG_INFO(Session, "Session valid for {}", profile->username);
    return SessionState::Authenticated;
}

void SessionManager::clearServerConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = StoredSession{};
    verified_ = false;
    persistLocked();
    LOG_INFO(Session, "Server configuration reset");
}

Result<std::monostate, AuthError> SessionManager::completePairing(
    const ServerConfig& issuer, const Credentials& credentials)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.server) {
        return Okay::error(
            AuthError::make(AuthError::Kind::NotConfigured, "Pairing finished with no server"));
    }
    if (session_.server->baseUrl != issuer.baseUrl) {
        LOG_WARN(
            Session,
            "Dropping credentials from {}; current server is {}",
            issuer.baseUrl,
            session_.server->baseUrl);
        return Okay::error(
            AuthError::make(AuthError::Kind::NotConfigured, "Server changed during pairing"));
    }

    session_.credentials = credentials;
    session_.user.reset();
    verified_ = true;
    persistLocked();
    LOG_INFO(
        Session, "Paired (token {})", LoggingChannels::redact(credentials.accessToken));
    return Okay::okay(std::monostate{});
}

Result<std::monostate, AuthError> SessionManager::activatePairingCode(
    const std::string& userCode, const CancellationToken& token)
{
    std::optional<ServerConfig> server;
    std::optional<Credentials> credentials;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = session_.server;
        credentials = session_.credentials;
    }
    if (!server) {
        return Okay::error(AuthError::make(AuthError::Kind::NotConfigured, "No validated server"));
    }
    if (!credentials) {
        return Okay::error(AuthError::make(AuthError::Kind::Unauthorized, "Not logged in"));
    }

    const std::string code = Pairing::normalizeUserCode(userCode);
    if (code.empty()) {
        return Okay::error(
            AuthError::make(AuthError::Kind::ServerRejected, "Pairing code is empty"));
    }

    const nlohmann::json body{ { "user_code", code } };
    auto request = makeRequest("POST", server->baseUrl + "/pair/activate", body.dump());
    request.headers["Authorization"] = "Bearer " + credentials->accessToken;

    const auto result = transport_.send(request, token.child(options_.requestTimeout));
    if (result.isError()) {
        return Okay::error(AuthError::fromHttpError(result.errorValue()));
    }

    const auto& response = result.value();
    if (!response.isSuccess()) {
        auto error = AuthError::fromResponse(response);
        if (error.kind == AuthError::Kind::Unauthorized) {
            reportUnauthorized();
        }
        LOG_WARN(Pairing, "Activation of {} failed: {}", code, error.message);
        return Okay::error(std::move(error));
    }

    LOG_INFO(Pairing, "Activated pairing code {}", code);
    return Okay::okay(std::monostate{});
}

std::optional<std::string> SessionManager::authorizationHeader() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.server || !session_.credentials) {
        return std::nullopt;
    }
    return "Bearer " + session_.credentials->accessToken;
}

void SessionManager::reportUnauthorized()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.credentials) {
        return;
    }
    LOG_WARN(Session, "Server rejected the access token; clearing credentials");
    clearCredentialsLocked();
    persistLocked();
}

SessionState SessionManager::getState() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.server || !session_.server->validated) {
        return SessionState::Unconfigured;
    }
    if (!session_.credentials || !verified_) {
        return SessionState::AwaitingAuth;
    }
    return SessionState::Authenticated;
}

std::optional<ServerConfig> SessionManager::getServerConfig() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.server;
}

std::optional<UserProfile> SessionManager::getUserProfile() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.user;
}

Network::HttpRequest SessionManager::makeRequest(
    const std::string& method, const std::string& url, const std::string& body) const
{
    Network::HttpRequest request;
    request.method = method;
    request.url = url;
    request.body = body;
    request.timeout = options_.requestTimeout;
    request.headers["Accept"] = "application/json";
    request.headers["X-Client-Name"] = options_.clientName;
    if (method == "POST") {
        request.headers["Content-Type"] = "application/json";
    }
    return request;
}

void SessionManager::persistLocked()
{
    auto saved = store_.save(session_);
    if (saved.isError()) {
        LOG_ERROR(Storage, "Session kept in memory only: {}", saved.errorValue().message);
    }
}

void SessionManager::clearCredentialsLocked()
{
    session_.credentials.reset();
    session_.user.reset();
    verified_ = false;
}

} // namespace Session
} // namespace ArcticLink
