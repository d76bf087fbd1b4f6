#include "HealthProbe.h"
#include "core/LoggingChannels.h"
#include <nlohmann/json.hpp>

namespace ArcticLink {
namespace Discovery {

HealthProbe::HealthProbe(Network::HttpTransport& transport, Options options)
    : transport_(transport), options_(std::move(options))
{}

Result<std::monostate, ProbeFailed> HealthProbe::probe(
    const std::string& baseUrl, const CancellationToken& token) const
{
    using R = Result<std::monostate, ProbeFailed>;

    Network::HttpRequest request;
    request.method = "GET";
    request.url = baseUrl + "/health";
    request.headers["Accept"] = "application/json";
    request.headers["X-Client-Name"] = options_.clientName;
    request.timeout = options_.timeout;

    LOG_DEBUG(Discovery, "Probing {} (timeout {}ms)", request.url, options_.timeout.count());

    // The probe's own deadline, independent of whatever the caller set.
    const auto result = transport_.send(request, token.child(options_.timeout));
    if (result.isError()) {
        const auto& error = result.errorValue();
        return R::error(ProbeFailed{
            .url = baseUrl,
            .diagnostic = std::string(Network::toString(error.kind)) + ": " + error.message,
        });
    }

    const auto& response = result.value();
    if (!response.isSuccess()) {
        return R::error(ProbeFailed{
            .url = baseUrl,
            .diagnostic = "HTTP " + std::to_string(response.status),
        });
    }

    if (nlohmann::json::parse(response.body, nullptr, false).is_discarded()) {
        return R::error(ProbeFailed{ .url = baseUrl, .diagnostic = "Health body is not JSON" });
    }

    LOG_INFO(Discovery, "Health probe succeeded for {}", baseUrl);
    return R::okay(std::monostate{});
}

} // namespace Discovery
} // namespace ArcticLink
