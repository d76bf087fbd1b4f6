#include "UserProfile.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Session {

namespace {

// Numeric ids and timestamps are kept as their decimal text.
std::string fieldText(const nlohmann::json& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::string optionalField(const nlohmann::json& j, const char* key)
{
    return j.contains(key) ? fieldText(j[key]) : "";
}

} // namespace

void to_json(nlohmann::json& j, const UserProfile& profile)
{
    j = nlohmann::json{
        { "id", profile.id },
        { "email", profile.email },
        { "username", profile.username },
        { "role", profile.role },
        { "created_at", profile.createdAt },
    };
}

void from_json(const nlohmann::json& j, UserProfile& profile)
{
    // id is required: at() throws type_error for a non-object, out_of_range when absent.
    profile.id = fieldText(j.at("id"));
    profile.email = optionalField(j, "email");
    profile.username = optionalField(j, "username");
    profile.role = optionalField(j, "role");
    profile.createdAt =
        j.contains("created_at") ? optionalField(j, "created_at") : optionalField(j, "createdAt");
}

} // namespace Session
} // namespace ArcticLink
