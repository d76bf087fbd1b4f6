#pragma once

#include "HttpTypes.h"
#include "core/CancellationToken.h"
#include "core/Result.h"

namespace ArcticLink {
namespace Network {

/**
 * @brief Blocking HTTP exchange. Implementations must be safe to call from
 * several threads at once and must return promptly once the token aborts.
 *
 * Any HTTP status (including 4xx/5xx) is a value; only failures to obtain a
 * response are errors.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse, HttpError> send(
        const HttpRequest& request, const CancellationToken& token) = 0;
};

} // namespace Network
} // namespace ArcticLink
