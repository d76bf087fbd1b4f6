#include "ServerConfig.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Session {

ServerConfig ServerConfig::fromValidatedBaseUrl(const std::string& baseUrl)
{
    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return ServerConfig{ .baseUrl = base, .apiBase = base + "/api", .validated = true };
}

void to_json(nlohmann::json& j, const ServerConfig& config)
{
    j = nlohmann::json{
        { "base_url", config.baseUrl },
        { "api_base", config.apiBase },
        { "validated", config.validated },
    };
}

void from_json(const nlohmann::json& j, ServerConfig& config)
{
    j.at("base_url").get_to(config.baseUrl);
    config.apiBase = j.value("api_base", config.baseUrl + "/api");
    config.validated = j.value("validated", false);
}

} // namespace Session
} // namespace ArcticLink
