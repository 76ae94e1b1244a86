#ifndef ATLASFS_EVENTS_EVENT_EMITTER_H
#define ATLASFS_EVENTS_EVENT_EMITTER_H

#include <atlasfs/events/event.h>

#include <string>

namespace atlasfs {

/**
 * Fire-and-forget publication of lifecycle events to a single topic.
 *
 * publish() must not throw and must not retry; a failed delivery is
 * reported through the returned outcome and the event is dropped.
 */
class EventEmitter {
   public:
    virtual ~EventEmitter() = default;
    virtual PublishOutcome publish(const Event &event) noexcept = 0;
    virtual const std::string &topic() const = 0;
};

}  // namespace atlasfs

#endif  // ATLASFS_EVENTS_EVENT_EMITTER_H
