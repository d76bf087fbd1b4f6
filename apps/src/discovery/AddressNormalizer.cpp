#include "AddressNormalizer.h"
#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>

namespace ArcticLink {
namespace Discovery {

namespace {

std::string trim(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

bool AddressNormalizer::isIpv4Literal(const std::string& authority)
{
    static const std::regex ipv4Prefix(R"(^\d+\.\d+\.\d+\.\d+)");
    return std::regex_search(authority, ipv4Prefix);
}

Result<Candidates, std::string> AddressNormalizer::normalize(const std::string& rawInput)
{
    using R = Result<Candidates, std::string>;

    const std::string input = trim(rawInput);
    if (input.empty()) {
        return R::error("Server address is empty");
    }

    std::optional<std::string> explicitScheme;
    std::string rest = input;

    // A "://" inside the path or query is not a scheme separator.
    const auto separator = input.find("://");
    if (separator != std::string::npos && separator < input.find_first_of("/?#")) {
        const std::string scheme = toLower(input.substr(0, separator));
        if (scheme != "http" && scheme != "https") {
            return R::error("Unsupported scheme '" + scheme + "'");
        }
        explicitScheme = scheme;
        rest = input.substr(separator + 3);
    }

    const std::string authority = rest.substr(0, rest.find_first_of("/?#"));
    if (authority.empty()) {
        return R::error("Server address has no host: " + input);
    }

    Candidates candidates;
    candidates.authority = authority;
    candidates.hostKind = isIpv4Literal(authority) ? HostKind::Ipv4Literal : HostKind::Hostname;
    const bool ipv4 = candidates.hostKind == HostKind::Ipv4Literal;

    std::vector<std::string> schemes;
    if (!explicitScheme.has_value()) {
        schemes = ipv4 ? std::vector<std::string>{ "http" }
                       : std::vector<std::string>{ "https", "http" };
    }
    else if (explicitScheme.value() == "https") {
        schemes = ipv4 ? std::vector<std::string>{ "https" }
                       : std::vector<std::string>{ "https", "http" };
    }
    else {
        schemes = ipv4 ? std::vector<std::string>{ "http" } : std::vector<std::string>{ "https" };
    }

    for (const auto& scheme : schemes) {
        candidates.urls.push_back(scheme + "://" + authority);
    }
    return R::okay(std::move(candidates));
}

} // namespace Discovery
} // namespace ArcticLink
