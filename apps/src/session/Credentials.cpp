#include "Credentials.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Session {

void to_json(nlohmann::json& j, const Credentials& credentials)
{
    j = nlohmann::json{ { "access_token", credentials.accessToken } };
    if (credentials.refreshToken.has_value()) {
        j["refresh_token"] = credentials.refreshToken.value();
    }
    else {
        j["refresh_token"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, Credentials& credentials)
{
    j.at("access_token").get_to(credentials.accessToken);
    credentials.refreshToken.reset();
    if (j.contains("refresh_token") && j["refresh_token"].is_string()) {
        credentials.refreshToken = j["refresh_token"].get<std::string>();
    }
}

} // namespace Session
} // namespace ArcticLink
