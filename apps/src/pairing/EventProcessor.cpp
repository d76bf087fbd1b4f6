#include "EventProcessor.h"
#include "PairingCoordinator.h"
#include "core/LoggingChannels.h"
#include "core/SynchronizedQueue.h"

namespace ArcticLink {
namespace Pairing {

struct EventQueue {
    SynchronizedQueue<Event> events;
};

EventProcessor::EventProcessor() : queue_(std::make_shared<EventQueue>())
{}

void EventProcessor::processEventsFromQueue(PairingCoordinator& coordinator)
{
    while (auto event = queue_->events.tryPop()) {
        LOG_TRACE(Pairing, "Delivering {}", getEventName(*event));
        coordinator.handleEvent(*event);
    }
}

void EventProcessor::clearQueue()
{
    const size_t dropped = queue_->events.size();
    queue_->events.clear();
    if (dropped > 0) {
        LOG_DEBUG(Pairing, "Discarded {} queued result(s)", dropped);
    }
}

void EventProcessor::post(EventQueue& queue, Event event)
{
    LOG_TRACE(Pairing, "Queued {}", getEventName(event));
    queue.events.push(std::move(event));
}

} // namespace Pairing
} // namespace ArcticLink
