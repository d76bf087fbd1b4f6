#pragma once

#include "Event.h"
#include <memory>

namespace ArcticLink {
namespace Pairing {

class PairingCoordinator;
struct EventQueue;

/**
 * @brief Inbox for results produced on executor threads.
 *
 * Workers hold the queue through a shared_ptr, so a request that finishes
 * after the coordinator is destroyed still has a valid place to post.
 */
class EventProcessor {
public:
    EventProcessor();

    // Owner thread only. Handles queued events in arrival order.
    void processEventsFromQueue(PairingCoordinator& coordinator);

    // Drops results of an earlier attempt.
    void clearQueue();

    std::shared_ptr<EventQueue> sharedQueue() const { return queue_; }

    // Safe from any thread.
    static void post(EventQueue& queue, Event event);

private:
    std::shared_ptr<EventQueue> queue_;
};

} // namespace Pairing
} // namespace ArcticLink
