#include <atlasfs/events/event.h>
#include <atlasfs/utils/id.h>
#include <atlasfs/utils/time.h>

namespace atlasfs {

const char *to_string(EventType type) {
    switch (type) {
        case EventType::UPLOAD_STARTED:
            return "file.upload.started";
        case EventType::CHUNK_CREATED:
            return "file.chunk.created";
        case EventType::UPLOAD_COMPLETED:
            return "file.upload.completed";
        case EventType::UPLOAD_FAILED:
            return "file.upload.failed";
        case EventType::DOWNLOAD_COMPLETED:
            return "file.download.completed";
        case EventType::FILE_DELETED:
            return "file.deleted";
    }
    return "unknown";
}

Event Event::create(EventType type, const std::string &source,
                    const std::string &key, nlohmann::json data) {
    Event event;
    event.id = utils::generate_event_id();
    event.type = type;
    event.timestamp = utils::now_iso8601();
    event.source = source;
    event.key = key;
    event.data = std::move(data);
    return event;
}

nlohmann::json Event::to_json() const {
    return nlohmann::json{{"id", id},
                          {"type", to_string(type)},
                          {"timestamp", timestamp},
                          {"source", source},
                          {"data", data}};
}

}  // namespace atlasfs
