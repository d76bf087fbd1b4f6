#include "PairingApi.h"
#include <algorithm>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Pairing {

namespace {

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

constexpr int kMaxSeconds = 86400;

// Whole seconds in [0, kMaxSeconds]. Absent, fractional or negative values read as 0.
int secondsField(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return 0;
    }
    const auto& value = j[key];
    if (value.is_number_unsigned()) {
        return static_cast<int>(std::min<uint64_t>(value.get<uint64_t>(), kMaxSeconds));
    }
    const int64_t seconds = value.get<int64_t>();
    return seconds <= 0 ? 0 : static_cast<int>(std::min<int64_t>(seconds, kMaxSeconds));
}

} // namespace

Result<PairRequestResponse, std::string> parsePairRequestResponse(const std::string& body)
{
    using R = Result<PairRequestResponse, std::string>;

    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_object()) {
        return R::error("Pair request response is not a JSON object");
    }

    PairRequestResponse response;
    const auto deviceCode = optionalString(j, "device_code");
    const auto userCode = optionalString(j, "user_code");
    if (!deviceCode || !userCode) {
        return R::error("Pair request response is missing device_code or user_code");
    }
    response.deviceCode = deviceCode.value();
    response.userCode = userCode.value();
    response.expiresIn = secondsField(j, "expires_in");
    response.interval = secondsField(j, "interval");
    response.serverUrl = optionalString(j, "server_url").value_or("");

    if (response.expiresIn <= 0) {
        return R::error("Pair request response has no usable expires_in");
    }
    return R::okay(std::move(response));
}

Result<PollResponse, std::string> parsePollResponse(const std::string& body)
{
    using R = Result<PollResponse, std::string>;

    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_object()) {
        return R::error("Poll response is not a JSON object");
    }

    PollResponse response;
    response.status = optionalString(j, "status").value_or("");
    response.accessToken = optionalString(j, "access_token");
    response.refreshToken = optionalString(j, "refresh_token");
    return R::okay(std::move(response));
}

} // namespace Pairing
} // namespace ArcticLink
