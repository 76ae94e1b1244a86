#ifndef ATLASFS_EVENTS_EVENT_H
#define ATLASFS_EVENTS_EVENT_H

#include <nlohmann/json.hpp>

#include <string>

namespace atlasfs {

enum class EventType {
    UPLOAD_STARTED,
    CHUNK_CREATED,
    UPLOAD_COMPLETED,
    UPLOAD_FAILED,
    DOWNLOAD_COMPLETED,
    FILE_DELETED
};

// Wire name, e.g. "file.chunk.created".
const char *to_string(EventType type);

struct Event {
    std::string id;
    EventType type;
    std::string timestamp;
    std::string source;
    // Message key on the topic: chunk id for chunk events, file id otherwise.
    std::string key;
    nlohmann::json data;

    // Fresh id and timestamp.
    static Event create(EventType type, const std::string &source,
                        const std::string &key, nlohmann::json data);

    // {id, type, timestamp, source, data}
    nlohmann::json to_json() const;
};

struct PublishOutcome {
    bool delivered = false;
    std::string error;

    static PublishOutcome ok() { return PublishOutcome{true, ""}; }
    static PublishOutcome failure(const std::string &message) {
        return PublishOutcome{false, message};
    }
};

}  // namespace atlasfs

#endif  // ATLASFS_EVENTS_EVENT_H
