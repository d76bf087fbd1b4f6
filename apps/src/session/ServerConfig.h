#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace ArcticLink {
namespace Session {

/**
 * @brief A server address that passed a health probe.
 *
 * Replaced wholesale when the server changes; never edited in place.
 */
struct ServerConfig {
    std::string baseUrl;
    std::string apiBase;
    bool validated = false;

    static ServerConfig fromValidatedBaseUrl(const std::string& baseUrl);

    bool operator==(const ServerConfig&) const = default;
};

void to_json(nlohmann::json& j, const ServerConfig& config);
void from_json(const nlohmann::json& j, ServerConfig& config);

} // namespace Session
} // namespace ArcticLink
