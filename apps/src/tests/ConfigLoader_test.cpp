#include "core/ClientConfig.h"
#include "core/ConfigLoader.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ArcticLink;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "arcticlink_config_loader_test";
        std::filesystem::remove_all(testDir_);
        std::filesystem::create_directories(testDir_);
        ConfigLoader::setConfigDir(testDir_.string());
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::ofstream file(testDir_ / filename);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, SearchPathsStartWithExplicitDirectory)
{
    const auto paths = ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), testDir_);
    EXPECT_EQ(paths.back(), std::filesystem::path("/etc/arcticlink"));
}

TEST_F(ConfigLoaderTest, LoadReturnsErrorWhenFileNotFound)
{
    auto result = ConfigLoader::load<ClientConfig>("arcticlink_missing_test.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadOrDefaultGivesDefaultsWhenFileMissing)
{
    auto result = ConfigLoader::loadOrDefault<ClientConfig>("arcticlink_missing_test.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().client_name, "ArcticLink");
    EXPECT_EQ(result.value().probe_timeout_ms, 10000);
    EXPECT_TRUE(result.value().verify_tls);
}

TEST_F(ConfigLoaderTest, PartialFileKeepsDefaultsForOmittedFields)
{
    writeConfigFile("arcticlink.json", R"({"client_name": "LivingRoomTV", "verify_tls": false})");

    auto result = ConfigLoader::load<ClientConfig>("arcticlink.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().client_name, "LivingRoomTV");
    EXPECT_FALSE(result.value().verify_tls);
    EXPECT_EQ(result.value().request_timeout_ms, 10000);
    EXPECT_EQ(result.value().pairing_request_retries, 1);
}

TEST_F(ConfigLoaderTest, LocalFileShadowsBaseFile)
{
    writeConfigFile("arcticlink.json", R"({"platform": "base"})");
    writeConfigFile("arcticlink.json.local", R"({"platform": "local"})");

    auto path = ConfigLoader::findConfigFile("arcticlink.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "arcticlink.json.local");

    auto result = ConfigLoader::load<ClientConfig>("arcticlink.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().platform, "local");
}

TEST_F(ConfigLoaderTest, MalformedJsonIsAnError)
{
    writeConfigFile("arcticlink.json", "not valid json {{{");

    auto result = ConfigLoader::loadOrDefault<ClientConfig>("arcticlink.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, WrongValueTypeIsAnError)
{
    writeConfigFile("arcticlink.json", R"({"probe_timeout_ms": "soon"})");

    auto result = ConfigLoader::load<ClientConfig>("arcticlink.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Invalid values"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyFileIsAnError)
{
    writeConfigFile("arcticlink.json", "");

    auto result = ConfigLoader::load<ClientConfig>("arcticlink.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Empty"), std::string::npos);
}

TEST(ClientConfigTest, UserAgentCombinesNameVersionAndPlatform)
{
    ClientConfig config;
    config.client_name = "ArcticTV";
    config.client_version = "2.1.0";
    config.platform = "tizen";

    EXPECT_EQ(config.userAgent(), "ArcticTV/2.1.0 (tizen)");
}

TEST(ClientConfigTest, CredentialStorePathExpandsHome)
{
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME not set";
    }

    ClientConfig config;
    EXPECT_EQ(
        config.credentialStorePath(),
        std::filesystem::path(home) / ".config/arcticlink/session.json");

    config.credential_store_path = "/var/lib/arcticlink/session.json";
    EXPECT_EQ(config.credentialStorePath(), std::filesystem::path("/var/lib/arcticlink/session.json"));
}

TEST(ClientConfigTest, JsonRoundTripPreservesEveryField)
{
    ClientConfig config;
    config.client_name = "Kiosk";
    config.connect_timeout_ms = 1500;
    config.pairing_default_interval_s = 7;

    const nlohmann::json j = config;
    const ClientConfig parsed = j.get<ClientConfig>();

    EXPECT_EQ(parsed.client_name, "Kiosk");
    EXPECT_EQ(parsed.connect_timeout_ms, 1500);
    EXPECT_EQ(parsed.pairing_default_interval_s, 7);
}
