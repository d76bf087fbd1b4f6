#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace ArcticLink {

/**
 * @brief Client-side settings read from arcticlink.json.
 *
 * Every field has a usable default, so an absent file is equivalent to "{}".
 */
struct ClientConfig {
    std::string client_name = "ArcticLink";
    std::string client_version = "1.0.0";
    std::string platform = "linux";

    int probe_timeout_ms = 10000;
    int request_timeout_ms = 10000;
    int connect_timeout_ms = 5000;
    bool verify_tls = true;

    // Leading "~" expands to $HOME.
    std::string credential_store_path = "~/.config/arcticlink/session.json";

    int pairing_request_retries = 1;
    int pairing_default_interval_s = 5;

    static constexpr const char* fileName() { return "arcticlink.json"; }

    std::string userAgent() const;
    std::filesystem::path credentialStorePath() const;

    std::chrono::milliseconds probeTimeout() const
    {
        return std::chrono::milliseconds(probe_timeout_ms);
    }
    std::chrono::milliseconds requestTimeout() const
    {
        return std::chrono::milliseconds(request_timeout_ms);
    }
};

void from_json(const nlohmann::json& j, ClientConfig& config);
void to_json(nlohmann::json& j, const ClientConfig& config);

} // namespace ArcticLink
