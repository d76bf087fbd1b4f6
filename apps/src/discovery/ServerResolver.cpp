#include "ServerResolver.h"
#include "AddressNormalizer.h"
#include "core/LoggingChannels.h"

namespace ArcticLink {
namespace Discovery {

ServerResolver::ServerResolver(const HealthProbe& probe) : probe_(probe)
{}

ServerResolver::ResolveResult ServerResolver::resolve(
    const std::string& rawInput, const CancellationToken& token) const
{
    auto candidates = AddressNormalizer::normalize(rawInput);
    if (candidates.isError()) {
        LOG_WARN(Discovery, "Rejected address '{}': {}", rawInput, candidates.errorValue());
        return ResolveResult::error(ResolveError{ .lastCause = candidates.errorValue() });
    }

    ResolveError failure;
    for (const auto& url : candidates.value().urls) {
        if (token.isCancelled()) {
            failure.cancelled = true;
            failure.lastCause = "Resolve cancelled";
            LOG_INFO(Discovery, "Resolve of '{}' cancelled", rawInput);
            return ResolveResult::error(std::move(failure));
        }

        failure.attemptedUrls.push_back(url);
        auto probed = probe_.probe(url, token);
        if (probed.isValue()) {
            LOG_INFO(Discovery, "Resolved '{}' to {}", rawInput, url);
            return ResolveResult::okay(Session::ServerConfig::fromValidatedBaseUrl(url));
        }

        failure.lastCause = probed.errorValue().diagnostic;
        LOG_INFO(Discovery, "Candidate {} failed: {}", url, failure.lastCause);
    }

    if (token.isCancelled()) {
        failure.cancelled = true;
    }
    LOG_WARN(
        Discovery,
        "No reachable server for '{}' after {} attempt(s)",
        rawInput,
        failure.attemptedUrls.size());
    return ResolveResult::error(std::move(failure));
}

AsyncOperation<ServerResolver::ResolveResult> ServerResolver::resolveAsync(
    TaskExecutor& executor, std::string rawInput) const
{
    return runAsync(executor, [this, rawInput = std::move(rawInput)](const CancellationToken& token) {
        return resolve(rawInput, token);
    });
}

} // namespace Discovery
} // namespace ArcticLink
