#pragma once

#include "core/Result.h"
#include <optional>
#include <string>

namespace ArcticLink {
namespace Pairing {

// Body of a 2xx POST /pair/request.
struct PairRequestResponse {
    std::string deviceCode;
    std::string userCode;
    int expiresIn = 0;
    int interval = 0;
    std::string serverUrl;
};

// Body of a 2xx POST /pair/poll.
struct PollResponse {
    std::string status;
    std::optional<std::string> accessToken;
    std::optional<std::string> refreshToken;
};

// device_code, user_code and a positive integer expires_in are required. expires_in
// and interval are capped at one day.
Result<PairRequestResponse, std::string> parsePairRequestResponse(const std::string& body);

// An absent status parses as "", which callers treat as a failure.
Result<PollResponse, std::string> parsePollResponse(const std::string& body);

} // namespace Pairing
} // namespace ArcticLink
