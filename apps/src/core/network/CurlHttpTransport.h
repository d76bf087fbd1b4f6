#pragma once

#include "HttpTransport.h"
#include <chrono>
#include <map>
#include <string>

namespace ArcticLink {
namespace Network {

class CurlHttpTransport : public HttpTransport {
public:
    struct Options {
        std::chrono::milliseconds connectTimeout{ 5000 };
        bool verifyTls = true;
        std::string userAgent;
        // Added to every request unless the request sets the same header.
        std::map<std::string, std::string> defaultHeaders;
    };

    explicit CurlHttpTransport(Options options);

    // Process-wide libcurl setup; call once before any transfer.
    static bool globalInit();
    static void globalCleanup();

    Result<HttpResponse, HttpError> send(
        const HttpRequest& request, const CancellationToken& token) override;

private:
    Options options_;
};

} // namespace Network
} // namespace ArcticLink
