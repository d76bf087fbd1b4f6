#pragma once

#include "core/Result.h"
#include <string>
#include <vector>

namespace ArcticLink {
namespace Discovery {

enum class HostKind { Ipv4Literal, Hostname };

inline const char* toString(HostKind kind)
{
    return kind == HostKind::Ipv4Literal ? "Ipv4Literal" : "Hostname";
}

/**
 * @brief Ordered probe candidates for one user-entered address.
 *
 * Each url is "scheme://authority" with no path and no trailing slash.
 */
struct Candidates {
    std::vector<std::string> urls;
    HostKind hostKind = HostKind::Hostname;
    std::string authority;
};

/**
 * @brief Turns free-form input into one or two candidate base URLs.
 *
 * Scheme policy:
 *   no scheme, IPv4 literal      -> [http]
 *   no scheme, hostname          -> [https, http]
 *   https://, hostname           -> [https, http]
 *   https://, IPv4 literal       -> [https]
 *   http://,  hostname           -> [https]  (upgraded, no downgrade retry)
 *   http://,  IPv4 literal       -> [http]
 *
 * Scheme matching ignores case. Path, query and fragment are dropped.
 */
class AddressNormalizer {
public:
    static Result<Candidates, std::string> normalize(const std::string& rawInput);

    static bool isIpv4Literal(const std::string& authority);
};

} // namespace Discovery
} // namespace ArcticLink
