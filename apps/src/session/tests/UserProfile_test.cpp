#include "session/UserProfile.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ArcticLink::Session;

TEST(UserProfileTest, NumericIdAndEitherTimestampSpelling)
{
    const auto snake = nlohmann::json::parse(
        R"({"id": 42, "email": "a@b.c", "username": "alice", "role": "user",
            "created_at": "2024-05-01T10:00:00Z"})");
    const auto camel = nlohmann::json::parse(R"({"id": "42", "createdAt": "2024-05-01T10:00:00Z"})");

    const auto fromSnake = snake.get<UserProfile>();
    const auto fromCamel = camel.get<UserProfile>();

    EXPECT_EQ(fromSnake.id, "42");
    EXPECT_EQ(fromSnake.username, "alice");
    EXPECT_EQ(fromCamel.id, "42");
    EXPECT_EQ(fromCamel.createdAt, "2024-05-01T10:00:00Z");
    EXPECT_EQ(fromCamel.email, "");
}

TEST(UserProfileTest, MissingIdThrows)
{
    const auto noId = nlohmann::json::parse(R"({"email": "a@b.c", "username": "alice"})");

    EXPECT_THROW(noId.get<UserProfile>(), nlohmann::json::out_of_range);
}

TEST(UserProfileTest, NonObjectThrows)
{
    const auto array = nlohmann::json::parse(R"([1, 2, 3])");
    const auto text = nlohmann::json("alice");

    EXPECT_THROW(array.get<UserProfile>(), nlohmann::json::exception);
    EXPECT_THROW(text.get<UserProfile>(), nlohmann::json::exception);
}

TEST(UserProfileTest, SurvivesJsonRoundTripWithStringId)
{
    const UserProfile profile{
        .id = "7", .email = "e", .username = "u", .role = "admin", .createdAt = "t"
    };

    EXPECT_EQ(nlohmann::json(profile).get<UserProfile>(), profile);
}
