#include "ClientConfig.h"
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace ArcticLink {

std::string ClientConfig::userAgent() const
{
    return client_name + "/" + client_version + " (" + platform + ")";
}

std::filesystem::path ClientConfig::credentialStorePath() const
{
    if (credential_store_path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / credential_store_path.substr(2);
        }
    }
    return std::filesystem::path(credential_store_path);
}

void from_json(const nlohmann::json& j, ClientConfig& config)
{
    const ClientConfig defaults;
    config.client_name = j.value("client_name", defaults.client_name);
    config.client_version = j.value("client_version", defaults.client_version);
    config.platform = j.value("platform", defaults.platform);
    config.probe_timeout_ms = j.value("probe_timeout_ms", defaults.probe_timeout_ms);
    config.request_timeout_ms = j.value("request_timeout_ms", defaults.request_timeout_ms);
    config.connect_timeout_ms = j.value("connect_timeout_ms", defaults.connect_timeout_ms);
    config.verify_tls = j.value("verify_tls", defaults.verify_tls);
    config.credential_store_path = j.value("credential_store_path", defaults.credential_store_path);
    config.pairing_request_retries =
        j.value("pairing_request_retries", defaults.pairing_request_retries);
    config.pairing_default_interval_s =
        j.value("pairing_default_interval_s", defaults.pairing_default_interval_s);
}

void to_json(nlohmann::json& j, const ClientConfig& config)
{
    j = nlohmann::json{
        { "client_name", config.client_name },
        { "client_version", config.client_version },
        { "platform", config.platform },
        { "probe_timeout_ms", config.probe_timeout_ms },
        { "request_timeout_ms", config.request_timeout_ms },
        { "connect_timeout_ms", config.connect_timeout_ms },
        { "verify_tls", config.verify_tls },
        { "credential_store_path", config.credential_store_path },
        { "pairing_request_retries", config.pairing_request_retries },
        { "pairing_default_interval_s", config.pairing_default_interval_s },
    };
}

} // namespace ArcticLink
