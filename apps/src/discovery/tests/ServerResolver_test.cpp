#include "core/TaskExecutor.h"
#include "discovery/ServerResolver.h"
#include "tests/MockHttpTransport.h"
#include <gtest/gtest.h>

using namespace ArcticLink;
using namespace ArcticLink::Discovery;
using ArcticLink::Tests::MockHttpTransport;

class ServerResolverTest : public ::testing::Test {
protected:
    MockHttpTransport transport_;
    HealthProbe probe_{ transport_, HealthProbe::Options{} };
    ServerResolver resolver_{ probe_ };
};

TEST_F(ServerResolverTest, FirstHealthyCandidateWins)
{
    transport_.respond("GET", "https://media.example.com/health", 200, "{}");

    auto result = resolver_.resolve("media.example.com");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().baseUrl, "https://media.example.com");
    EXPECT_EQ(result.value().apiBase, "https://media.example.com/api");
    EXPECT_TRUE(result.value().validated);
    EXPECT_EQ(transport_.requestedUrls(), (std::vector<std::string>{ "https://media.example.com/health" }));
}

TEST_F(ServerResolverTest, FallsBackToHttpWhenHttpsFails)
{
    transport_.fail("GET", "https://media.example.com/health", Network::HttpError::Kind::Connection);
    transport_.respond("GET", "http://media.example.com/health", 200, R"({"ok":true})");

    auto result = resolver_.resolve("media.example.com");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().baseUrl, "http://media.example.com");
    EXPECT_EQ(
        transport_.requestedUrls(),
        (std::vector<std::string>{ "https://media.example.com/health",
                                   "http://media.example.com/health" }));
}

TEST_F(ServerResolverTest, AllCandidatesFailingReportsLastCauseAndAttempts)
{
    transport_.fail("GET", "https://media.example.com/health", Network::HttpError::Kind::Timeout);
    transport_.respond("GET", "http://media.example.com/health", 502, "");

    auto result = resolver_.resolve("media.example.com");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().lastCause, "HTTP 502");
    EXPECT_FALSE(result.errorValue().cancelled);
    EXPECT_EQ(
        result.errorValue().attemptedUrls,
        (std::vector<std::string>{ "https://media.example.com", "http://media.example.com" }));
}

TEST_F(ServerResolverTest, NeverIssuesMoreRequestsThanCandidates)
{
    auto result = resolver_.resolve("192.168.1.50:8085");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(transport_.requestedUrls(), (std::vector<std::string>{ "http://192.168.1.50:8085/health" }));
}

TEST_F(ServerResolverTest, AttemptOrderIsDeterministic)
{
    resolver_.resolve("nas.local:8085");
    const auto first = transport_.requestedUrls();
    transport_.clearRequests();

    resolver_.resolve("nas.local:8085");

    EXPECT_EQ(transport_.requestedUrls(), first);
}

TEST_F(ServerResolverTest, InvalidInputIssuesNoRequests)
{
    auto result = resolver_.resolve("   ");

    ASSERT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().attemptedUrls.empty());
    EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(ServerResolverTest, CancellationStopsBeforeTheNextCandidate)
{
    CancellationToken token;
    transport_.setBeforeSend([&token](const Network::HttpRequest&) { token.cancel(); });

    auto result = resolver_.resolve("media.example.com", token);

    ASSERT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().cancelled);
    EXPECT_EQ(transport_.requests().size(), 1u);
}

TEST_F(ServerResolverTest, ResolveAsyncDeliversTheSameResult)
{
    transport_.respond("GET", "http://10.1.1.1/health", 200, "{}");
    ThreadTaskExecutor executor;

    auto op = resolver_.resolveAsync(executor, "10.1.1.1");
    auto result = op.get();

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().baseUrl, "http://10.1.1.1");
}
