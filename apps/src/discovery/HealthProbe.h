#pragma once

#include "core/CancellationToken.h"
#include "core/Result.h"
#include "core/network/HttpTransport.h"
#include <chrono>
#include <string>
#include <variant>

namespace ArcticLink {
namespace Discovery {

// Uniform probe failure. diagnostic is for logs only.
struct ProbeFailed {
    std::string url;
    std::string diagnostic;
};

class HealthProbe {
public:
    struct Options {
        std::chrono::milliseconds timeout{ 10000 };
        std::string clientName = "ArcticLink";
    };

    HealthProbe(Network::HttpTransport& transport, Options options);

    // GET {baseUrl}/health; succeeds on 2xx with a JSON body.
    Result<std::monostate, ProbeFailed> probe(
        const std::string& baseUrl, const CancellationToken& token) const;

private:
    Network::HttpTransport& transport_;
    Options options_;
};

} // namespace Discovery
} // namespace ArcticLink
