#pragma once

namespace ArcticLink {
namespace Pairing {

class PairingCoordinator;

namespace State {

struct Authorized;
struct Expired;
struct Failed;
struct Idle;
struct Polling;
struct Requesting;

class Any;

} // namespace State
} // namespace Pairing
} // namespace ArcticLink
