#ifndef ATLASFS_EVENTS_FILE_EVENT_EMITTER_H
#define ATLASFS_EVENTS_FILE_EVENT_EMITTER_H

#include <atlasfs/common/constants.h>
#include <atlasfs/events/event_emitter.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace atlasfs {

// One message as read back from a topic file.
struct TopicMessage {
    std::string key;
    std::string type;
    std::string event_id;
    std::string file_id;
    // Compact JSON of the whole envelope.
    std::string payload;
};

/**
 * Appends events to <directory>/<topic>.jsonl, one
 * {"key": ..., "value": <envelope>} object per line.
 */
class FileEventEmitter : public EventEmitter {
   public:
    // Throws std::runtime_error if the directory cannot be created.
    explicit FileEventEmitter(const std::string &directory,
                              const std::string &topic =
                                  constants::events::TOPIC);

    PublishOutcome publish(const Event &event) noexcept override;
    const std::string &topic() const override { return topic_; }

    const std::filesystem::path &topic_path() const { return path_; }

    // Reads every well-formed message currently in the topic file.
    std::vector<TopicMessage> read_all() const;

   private:
    std::string topic_;
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}  // namespace atlasfs

#endif  // ATLASFS_EVENTS_FILE_EVENT_EMITTER_H
