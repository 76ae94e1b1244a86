#include <atlasfs/events/memory_event_emitter.h>

namespace atlasfs {

PublishOutcome MemoryEventEmitter::publish(const Event &event) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        return PublishOutcome::ok();
    } catch (const std::exception &e) {
        return PublishOutcome::failure(e.what());
    }
}

std::vector<Event> MemoryEventEmitter::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<Event> MemoryEventEmitter::events_of(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto &event : events_) {
        if (event.type == type) {
            out.push_back(event);
        }
    }
    return out;
}

void MemoryEventEmitter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

}  // namespace atlasfs
