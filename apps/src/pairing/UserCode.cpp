#include "UserCode.h"
#include <cctype>

namespace ArcticLink {
namespace Pairing {

std::string normalizeUserCode(const std::string& userCode)
{
    const auto begin = userCode.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = userCode.find_last_not_of(" \t\r\n");

    std::string normalized;
    for (size_t i = begin; i <= end; ++i) {
        const char c = userCode[i];
        normalized += c == ' ' ? '-' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return normalized;
}

std::string formatUserCode(const std::string& userCode)
{
    if (userCode.find('-') != std::string::npos || userCode.size() <= 4) {
        return userCode;
    }

    std::string formatted;
    for (size_t i = 0; i < userCode.size(); ++i) {
        if (i > 0 && i % 4 == 0) {
            formatted += ' ';
        }
        formatted += userCode[i];
    }
    return formatted;
}

} // namespace Pairing
} // namespace ArcticLink
