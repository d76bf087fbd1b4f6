#pragma once

#include "core/Clock.h"
#include <string>

namespace ArcticLink {
namespace Pairing {

// One pairing attempt. Lives only inside the Polling state.
struct PairingSession {
    std::string deviceCode;
    std::string userCode;
    std::string verificationUrl;
    int pollIntervalSeconds = 5;
    Clock::TimePoint expiresAt;
    int attempts = 0;
};

} // namespace Pairing
} // namespace ArcticLink
