#include <atlasfs/common/logging.h>
#include <atlasfs/events/file_event_emitter.h>
#include <atlasfs/utils/json.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace atlasfs {

FileEventEmitter::FileEventEmitter(const std::string &directory,
                                   const std::string &topic)
    : topic_(topic) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create event directory " + directory +
                                 ": " + ec.message());
    }
    path_ = fs::path(directory) /
            (topic_ + constants::events::TOPIC_FILE_EXTENSION);
}

PublishOutcome FileEventEmitter::publish(const Event &event) noexcept {
    try {
        nlohmann::json message{{"key", event.key}, {"value", event.to_json()}};
        std::string line = message.dump() + "\n";

        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        if (!out.is_open()) {
            return PublishOutcome::failure("cannot open topic file " +
                                           path_.string());
        }
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        out.flush();
        if (!out) {
            return PublishOutcome::failure("write to topic file " +
                                           path_.string() + " failed");
        }
        return PublishOutcome::ok();
    } catch (const std::exception &e) {
        return PublishOutcome::failure(e.what());
    }
}

std::vector<TopicMessage> FileEventEmitter::read_all() const {
    std::string content;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream in(path_, std::ios::binary);
        if (!in.is_open()) {
            return {};
        }
        content.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
    }

    std::vector<TopicMessage> messages;
    utils::json::JsonParser parser;
    utils::json::for_each_json_line(
        parser, content.data(), content.size(),
        [&messages](const utils::json::JsonDocument &doc) {
            auto value = doc["value"];
            if (value.error()) {
                return;
            }
            TopicMessage message;
            message.key = utils::json::get_string_field(doc, "key");
            message.type = utils::json::get_string_field(value.value(), "type");
            message.event_id =
                utils::json::get_string_field(value.value(), "id");
            auto data = value.value()["data"];
            if (!data.error()) {
                message.file_id =
                    utils::json::get_string_field(data.value(), "file_id");
            }
            message.payload = utils::json::get_raw_field(doc, "value");
            messages.push_back(std::move(message));
        });
    ATLASFS_LOG_DEBUG("Read {} messages from {}", messages.size(),
                      path_.string());
    return messages;
}

}  // namespace atlasfs
