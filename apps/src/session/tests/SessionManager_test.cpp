#include "session/SessionManager.h"
#include "tests/MockHttpTransport.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ArcticLink;
using namespace ArcticLink::Session;
using ArcticLink::Tests::MockHttpTransport;

namespace {

const std::string kBase = "https://media.example.com";
const std::string kApi = kBase + "/api";

const std::string kLoginBody = R"({
    "token": "access-abc123456",
    "refresh_token": "refresh-xyz",
    "user": {"id": 42, "email": "alice@example.com", "username": "alice", "role": "user",
             "created_at": "2024-05-01T10:00:00Z"}
})";

const std::string kMeBody = R"({"id": 42, "email": "alice@example.com", "username": "alice",
                                "role": "user", "created_at": "2024-05-01T10:00:00Z"})";

} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    void configure() { ASSERT_TRUE(manager_.setServerConfig(ServerConfig::fromValidatedBaseUrl(kBase)).isValue()); }

    void loginAsAlice()
    {
        configure();
        transport_.respond("POST", kApi + "/auth/login", 200, kLoginBody);
        ASSERT_TRUE(manager_.login("alice", "secret").isValue());
    }

    StoredSession stored()
    {
        auto loaded = store_.load();
        EXPECT_TRUE(loaded.isValue());
        return loaded.isValue() ? loaded.value() : StoredSession{};
    }

    MockHttpTransport transport_;
    InMemoryCredentialStore store_;
    SessionManager manager_{ transport_, store_ };
};

TEST_F(SessionManagerTest, StartsUnconfigured)
{
    manager_.loadPersisted();
    EXPECT_EQ(manager_.getState(), SessionState::Unconfigured);
    EXPECT_EQ(manager_.checkAuth(), SessionState::Unconfigured);
    EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(SessionManagerTest, UnvalidatedConfigIsRefused)
{
    ServerConfig config{ .baseUrl = kBase, .apiBase = kApi, .validated = false };

    auto result = manager_.setServerConfig(config);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::NotConfigured);
    EXPECT_EQ(manager_.getState(), SessionState::Unconfigured);
}

TEST_F(SessionManagerTest, LoginWithoutServerIsNotConfigured)
{
    auto result = manager_.login("alice", "secret");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::NotConfigured);
    EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(SessionManagerTest, LoginPersistsTokenAndProfile)
{
    configure();
    transport_.respond("POST", kApi + "/auth/login", 200, kLoginBody);

    auto result = manager_.login("alice", "secret");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().id, "42");
    EXPECT_EQ(manager_.getState(), SessionState::Authenticated);

    const auto session = stored();
    ASSERT_TRUE(session.credentials.has_value());
    EXPECT_EQ(session.credentials->accessToken, "access-abc123456");
    EXPECT_EQ(session.credentials->refreshToken, std::optional<std::string>("refresh-xyz"));
    ASSERT_TRUE(session.user.has_value());
    EXPECT_EQ(session.user->username, "alice");

    const auto requests = transport_.requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(body["identifier"], "alice");
    EXPECT_EQ(body["password"], "secret");
    EXPECT_EQ(requests[0].timeout, std::chrono::milliseconds(10000));
}

TEST_F(SessionManagerTest, RejectedLoginSurfacesServerMessageAndIsNotRetried)
{
    configure();
    transport_.respond("POST", kApi + "/auth/login", 401, R"({"detail":"Invalid credentials"})");

    auto result = manager_.login("alice", "wrong");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::ServerRejected);
    EXPECT_EQ(result.errorValue().message, "Invalid credentials");
    EXPECT_EQ(result.errorValue().httpStatus, 401);
    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_EQ(transport_.countRequests("POST", kApi + "/auth/login"), 1u);
}

TEST_F(SessionManagerTest, LoginWhoseUserHasNoIdIsMalformed)
{
    configure();
    transport_.respond(
        "POST",
        kApi + "/auth/login",
        200,
        R"({"token":"access-abc123456","user":{"email":"a@b.c","username":"alice"}})");

    auto result = manager_.login("alice", "secret");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::ServerRejected);
    EXPECT_EQ(result.errorValue().message, "Malformed login response");
    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
}

TEST_F(SessionManagerTest, LoginTimeoutLeavesStateUnchanged)
{
    configure();
    transport_.fail("POST", kApi + "/auth/login", Network::HttpError::Kind::Timeout);

    auto result = manager_.login("alice", "secret");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::TransportFailure);
    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
}

TEST_F(SessionManagerTest, CancelledLoginPersistsNothing)
{
    configure();
    transport_.respond("POST", kApi + "/auth/login", 200, kLoginBody);
    CancellationToken token;
    token.cancel();

    auto result = manager_.login("alice", "secret", token);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::Cancelled);
    EXPECT_FALSE(stored().credentials.has_value());
}

TEST_F(SessionManagerTest, LoginThenCheckAuthKeepsTheSameUser)
{
    loginAsAlice();
    transport_.respond("GET", kApi + "/auth/me", 200, kMeBody);

    EXPECT_EQ(manager_.checkAuth(), SessionState::Authenticated);
    ASSERT_TRUE(manager_.getUserProfile().has_value());
    EXPECT_EQ(manager_.getUserProfile()->id, "42");

    const auto requests = transport_.requests();
    EXPECT_EQ(requests.back().headers.at("Authorization"), "Bearer access-abc123456");
}

TEST_F(SessionManagerTest, CheckAuthAfterRestartRevalidatesStoredToken)
{
    loginAsAlice();
    transport_.respond("GET", kApi + "/auth/me", 200, kMeBody);

    SessionManager restarted(transport_, store_);
    restarted.loadPersisted();
    EXPECT_EQ(restarted.getState(), SessionState::AwaitingAuth);

    EXPECT_EQ(restarted.checkAuth(), SessionState::Authenticated);
}

TEST_F(SessionManagerTest, CheckAuth401ClearsCredentials)
{
    loginAsAlice();
    transport_.respond("GET", kApi + "/auth/me", 401, R"({"detail":"Invalid token"})");

    EXPECT_EQ(manager_.checkAuth(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
    EXPECT_TRUE(stored().server.has_value());
}

TEST_F(SessionManagerTest, CheckAuthWithUnreachableServerFailsOpenInOneAttempt)
{
    loginAsAlice();
    transport_.fail("GET", kApi + "/auth/me", Network::HttpError::Kind::Timeout);

    EXPECT_EQ(manager_.checkAuth(), SessionState::AwaitingAuth);
    EXPECT_EQ(transport_.countRequests("GET", kApi + "/auth/me"), 1u);
    EXPECT_FALSE(stored().credentials.has_value());
}

TEST_F(SessionManagerTest, CheckAuthWithoutTokenNeedsNoRequest)
{
    configure();

    EXPECT_EQ(manager_.checkAuth(), SessionState::AwaitingAuth);
    EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(SessionManagerTest, LogoutClearsCredentialsWhenServerSucceeds)
{
    loginAsAlice();
    transport_.respond("POST", kApi + "/auth/logout", 200, "{}");

    manager_.logout();

    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
    EXPECT_FALSE(stored().user.has_value());
    EXPECT_TRUE(stored().server.has_value());
    EXPECT_EQ(transport_.requests().back().headers.at("Authorization"), "Bearer access-abc123456");
}

TEST_F(SessionManagerTest, LogoutClearsCredentialsWhenServerTimesOut)
{
    loginAsAlice();
    transport_.fail("POST", kApi + "/auth/logout", Network::HttpError::Kind::Timeout);

    manager_.logout();

    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
}

TEST_F(SessionManagerTest, LogoutClearsCredentialsWhenServerUnreachable)
{
    loginAsAlice();

    manager_.logout();

    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
    EXPECT_EQ(manager_.authorizationHeader(), std::nullopt);
}

TEST_F(SessionManagerTest, ClearServerConfigRemovesEverything)
{
    loginAsAlice();

    manager_.clearServerConfig();

    EXPECT_EQ(manager_.getState(), SessionState::Unconfigured);
    EXPECT_EQ(stored(), StoredSession{});
    EXPECT_FALSE(manager_.getServerConfig().has_value());
    EXPECT_FALSE(manager_.getUserProfile().has_value());
}

TEST_F(SessionManagerTest, SwitchingServerDropsCredentials)
{
    loginAsAlice();

    ASSERT_TRUE(
        manager_.setServerConfig(ServerConfig::fromValidatedBaseUrl("http://192.168.1.50:8085"))
            .isValue());

    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
    EXPECT_EQ(stored().server->baseUrl, "http://192.168.1.50:8085");
}

TEST_F(SessionManagerTest, ReapplyingSameServerKeepsCredentials)
{
    loginAsAlice();

    configure();

    EXPECT_EQ(manager_.getState(), SessionState::Authenticated);
}

TEST_F(SessionManagerTest, CompletePairingAuthenticatesWithoutProfile)
{
    configure();

    auto result = manager_.completePairing(
        ServerConfig::fromValidatedBaseUrl(kBase),
        Credentials{ .accessToken = "paired", .refreshToken = "r" });

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(manager_.getState(), SessionState::Authenticated);
    EXPECT_FALSE(manager_.getUserProfile().has_value());
    EXPECT_EQ(manager_.authorizationHeader(), std::optional<std::string>("Bearer paired"));
}

TEST_F(SessionManagerTest, CompletePairingWithoutServerIsRejected)
{
    auto result = manager_.completePairing(
        ServerConfig::fromValidatedBaseUrl(kBase), Credentials{ .accessToken = "paired" });

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::NotConfigured);
}

TEST_F(SessionManagerTest, CompletePairingFromAnotherServerIsRejected)
{
    configure();

    auto result = manager_.completePairing(
        ServerConfig::fromValidatedBaseUrl("http://10.0.0.9:8085"),
        Credentials{ .accessToken = "foreign" });

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::NotConfigured);
    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
    EXPECT_EQ(manager_.authorizationHeader(), std::nullopt);
}

TEST_F(SessionManagerTest, ActivateNormalizesCodeAndSendsBearer)
{
    loginAsAlice();
    transport_.respond("POST", kBase + "/pair/activate", 200, R"({"status":"ok"})");

    auto result = manager_.activatePairingCode(" abcd 1234 ");

    ASSERT_TRUE(result.isValue());
    const auto request = transport_.requests().back();
    EXPECT_EQ(nlohmann::json::parse(request.body)["user_code"], "ABCD-1234");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer access-abc123456");
}

TEST_F(SessionManagerTest, Activate401ClearsCredentials)
{
    loginAsAlice();
    transport_.respond("POST", kBase + "/pair/activate", 401, R"({"detail":"Not authenticated"})");

    auto result = manager_.activatePairingCode("ABCD-1234");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::Unauthorized);
    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
}

TEST_F(SessionManagerTest, ActivateUnknownCodeIsServerRejected)
{
    loginAsAlice();
    transport_.respond("POST", kBase + "/pair/activate", 404, R"({"detail":"Invalid user code"})");

    auto result = manager_.activatePairingCode("ZZZZ-9999");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, AuthError::Kind::ServerRejected);
    EXPECT_EQ(result.errorValue().message, "Invalid user code");
    EXPECT_EQ(manager_.getState(), SessionState::Authenticated);
}

TEST_F(SessionManagerTest, ReportUnauthorizedClearsCredentials)
{
    loginAsAlice();

    manager_.reportUnauthorized();

    EXPECT_EQ(manager_.getState(), SessionState::AwaitingAuth);
    EXPECT_FALSE(stored().credentials.has_value());
}

namespace {

// Store that fails every write after the first `allowed` saves.
class FlakyStore : public CredentialStore {
public:
    Result<StoredSession, AuthError> load() override
    {
        return Result<StoredSession, AuthError>::okay(StoredSession{});
    }

    Result<std::monostate, AuthError> save(const StoredSession&) override
    {
        return Result<std::monostate, AuthError>::error(
            AuthError::make(AuthError::Kind::StorageFailure, "disk full"));
    }
};

} // namespace

TEST(SessionManagerStorageTest, StorageFailureStillClearsInMemoryOnLogout)
{
    MockHttpTransport transport;
    FlakyStore store;
    SessionManager manager(transport, store);
    ASSERT_TRUE(manager.setServerConfig(ServerConfig::fromValidatedBaseUrl(kBase)).isValue());
    transport.respond("POST", kApi + "/auth/login", 200, kLoginBody);
    ASSERT_TRUE(manager.login("alice", "secret").isValue());

    manager.logout();

    EXPECT_EQ(manager.getState(), SessionState::AwaitingAuth);
    EXPECT_EQ(manager.authorizationHeader(), std::nullopt);
}

TEST(SessionManagerStorageTest, CorruptStoreStartsUnconfigured)
{
    class CorruptStore : public CredentialStore {
    public:
        Result<StoredSession, AuthError> load() override
        {
            return Result<StoredSession, AuthError>::error(
                AuthError::make(AuthError::Kind::StorageFailure, "corrupt"));
        }
        Result<std::monostate, AuthError> save(const StoredSession&) override
        {
            return Result<std::monostate, AuthError>::okay(std::monostate{});
        }
    };

    MockHttpTransport transport;
    CorruptStore store;
    SessionManager manager(transport, store);

    manager.loadPersisted();

    EXPECT_EQ(manager.getState(), SessionState::Unconfigured);
}
