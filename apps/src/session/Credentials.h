#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace ArcticLink {
namespace Session {

struct Credentials {
    std::string accessToken;
    std::optional<std::string> refreshToken;

    bool operator==(const Credentials&) const = default;
};

void to_json(nlohmann::json& j, const Credentials& credentials);
void from_json(const nlohmann::json& j, Credentials& credentials);

} // namespace Session
} // namespace ArcticLink
