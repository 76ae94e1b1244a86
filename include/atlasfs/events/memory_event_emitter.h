#ifndef ATLASFS_EVENTS_MEMORY_EVENT_EMITTER_H
#define ATLASFS_EVENTS_MEMORY_EVENT_EMITTER_H

#include <atlasfs/common/constants.h>
#include <atlasfs/events/event_emitter.h>

#include <mutex>
#include <string>
#include <vector>

namespace atlasfs {

class MemoryEventEmitter : public EventEmitter {
   public:
    explicit MemoryEventEmitter(
        const std::string &topic = constants::events::TOPIC)
        : topic_(topic) {}

    PublishOutcome publish(const Event &event) noexcept override;
    const std::string &topic() const override { return topic_; }

    std::vector<Event> events() const;
    std::vector<Event> events_of(EventType type) const;
    void clear();

   private:
    std::string topic_;
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// Stand-in when no bus could be reached: every publish fails.
class NullEventEmitter : public EventEmitter {
   public:
    explicit NullEventEmitter(
        const std::string &topic = constants::events::TOPIC)
        : topic_(topic) {}

    PublishOutcome publish(const Event &) noexcept override {
        return PublishOutcome::failure("event bus unavailable");
    }
    const std::string &topic() const override { return topic_; }

   private:
    std::string topic_;
};

}  // namespace atlasfs

#endif  // ATLASFS_EVENTS_MEMORY_EVENT_EMITTER_H
