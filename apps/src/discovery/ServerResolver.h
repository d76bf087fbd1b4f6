#pragma once

#include "HealthProbe.h"
#include "core/AsyncOperation.h"
#include "core/CancellationToken.h"
#include "core/Result.h"
#include "session/ServerConfig.h"
#include <string>
#include <vector>

namespace ArcticLink {
namespace Discovery {

struct ResolveError {
    std::string lastCause;
    // Every URL probed, in the order probed.
    std::vector<std::string> attemptedUrls;
    bool cancelled = false;
};

/**
 * @brief Validates a user-entered address against the server's health endpoint.
 *
 * Candidates are probed strictly one after another, in normalizer order, and
 * the first healthy one wins. The resolver stores nothing; the caller hands
 * the returned config to SessionManager.
 */
class ServerResolver {
public:
    using ResolveResult = Result<Session::ServerConfig, ResolveError>;

    explicit ServerResolver(const HealthProbe& probe);

    ResolveResult resolve(
        const std::string& rawInput, const CancellationToken& token = CancellationToken{}) const;

    // Runs resolve() on the executor. The resolver must outlive the operation.
    AsyncOperation<ResolveResult> resolveAsync(TaskExecutor& executor, std::string rawInput) const;

private:
    const HealthProbe& probe_;
};

} // namespace Discovery
} // namespace ArcticLink
