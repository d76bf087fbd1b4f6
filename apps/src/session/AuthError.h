#pragma once

#include "core/network/HttpTypes.h"
#include <string>

namespace ArcticLink {
namespace Session {

struct AuthError {
    enum class Kind {
        NotConfigured,
        ProbeFailed,
        Unauthorized,
        ServerRejected,
        Expired,
        Denied,
        StorageFailure,
        TransportFailure,
        Cancelled,
    };

    Kind kind = Kind::ServerRejected;
    std::string message;
    int httpStatus = 0;

    static AuthError make(Kind kind, std::string message, int httpStatus = 0);

    // 401 -> Unauthorized, anything else -> ServerRejected, with the server's message.
    static AuthError fromResponse(const Network::HttpResponse& response);

    // Cancelled stays Cancelled; timeouts and connection errors are TransportFailure.
    static AuthError fromHttpError(const Network::HttpError& error);

    // detail, then message, then error from a JSON body; "HTTP <status>" otherwise.
    static std::string serverMessage(const Network::HttpResponse& response);
};

const char* toString(AuthError::Kind kind);

} // namespace Session
} // namespace ArcticLink
