#pragma once

#include <string>

namespace ArcticLink {
namespace Pairing {

// Upper-case, surrounding whitespace trimmed, inner spaces become '-'.
std::string normalizeUserCode(const std::string& userCode);

// Codes with a '-' are shown as-is; others are split into groups of four.
std::string formatUserCode(const std::string& userCode);

} // namespace Pairing
} // namespace ArcticLink
