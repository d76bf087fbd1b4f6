#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace ArcticLink {
namespace Session {

// Cached copy of the server's user record; may be stale until the next checkAuth.
struct UserProfile {
    std::string id;
    std::string email;
    std::string username;
    std::string role;
    std::string createdAt;

    bool operator==(const UserProfile&) const = default;
};

// Accepts string or numeric ids and both created_at / createdAt spellings.
void to_json(nlohmann::json& j, const UserProfile& profile);
void from_json(const nlohmann::json& j, UserProfile& profile);

} // namespace Session
} // namespace ArcticLink
