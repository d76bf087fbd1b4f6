#include "AuthError.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Session {

AuthError AuthError::make(Kind kind, std::string message, int httpStatus)
{
    return AuthError{ .kind = kind, .message = std::move(message), .httpStatus = httpStatus };
}

AuthError AuthError::fromResponse(const Network::HttpResponse& response)
{
    const Kind kind = response.status == 401 ? Kind::Unauthorized : Kind::ServerRejected;
    return make(kind, serverMessage(response), static_cast<int>(response.status));
}

AuthError AuthError::fromHttpError(const Network::HttpError& error)
{
    if (error.kind == Network::HttpError::Kind::Cancelled) {
        return make(Kind::Cancelled, error.message);
    }
    return make(
        Kind::TransportFailure, std::string(Network::toString(error.kind)) + ": " + error.message);
}

std::string AuthError::serverMessage(const Network::HttpResponse& response)
{
    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_object()) {
        for (const char* key : { "detail", "message", "error" }) {
            if (body.contains(key) && body[key].is_string()) {
                return body[key].get<std::string>();
            }
        }
    }
    return "HTTP " + std::to_string(response.status);
}

const char* toString(AuthError::Kind kind)
{
    switch (kind) {
        case AuthError::Kind::NotConfigured:
            return "NotConfigured";
        case AuthError::Kind::ProbeFailed:
            return "ProbeFailed";
        case AuthError::Kind::Unauthorized:
            return "Unauthorized";
        case AuthError::Kind::ServerRejected:
            return "ServerRejected";
        case AuthError::Kind::Expired:
            return "Expired";
        case AuthError::Kind::Denied:
            return "Denied";
        case AuthError::Kind::StorageFailure:
            return "StorageFailure";
        case AuthError::Kind::TransportFailure:
            return "TransportFailure";
        case AuthError::Kind::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

} // namespace Session
} // namespace ArcticLink
