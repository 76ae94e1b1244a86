#include <atlasfs/common/logging.h>
#include <atlasfs/service/config.h>
#include <atlasfs/utils/json.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace atlasfs {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

std::uint64_t parse_unsigned(const std::string& name,
                             const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") !=
                             std::string::npos) {
        throw std::invalid_argument(name + " must be a non-negative integer, got '" +
                                    value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: " + value);
    }
}

const std::string LEVELS[] = {"trace", "debug",    "info", "warn", "warning",
                              "err",   "error",    "critical", "off"};

}  // namespace

std::string ServiceConfig::db_path() const {
    if (!db_path_.empty()) return db_path_;
    return (fs::path(data_dir_) / service::DEFAULT_DB_FILE).string();
}

std::string ServiceConfig::events_dir() const {
    if (!events_dir_.empty()) return events_dir_;
    return (fs::path(data_dir_) / service::DEFAULT_EVENTS_DIR).string();
}

ServiceConfig ServiceConfig::from_env() { return Default().apply_env(); }

ServiceConfig& ServiceConfig::apply_env() {
    if (const char* v = env_or_null("ATLASFS_DATA_DIR")) set_data_dir(v);
    if (const char* v = env_or_null("ATLASFS_DB_PATH")) set_db_path(v);
    if (const char* v = env_or_null("ATLASFS_BUCKET")) set_bucket(v);
    if (const char* v = env_or_null("ATLASFS_EVENTS_DIR")) set_events_dir(v);
    if (const char* v = env_or_null("ATLASFS_CHUNK_SIZE")) {
        set_chunk_size(static_cast<std::size_t>(
            parse_unsigned("ATLASFS_CHUNK_SIZE", v)));
    }
    if (const char* v = env_or_null("ATLASFS_METADATA_RETRIES")) {
        set_metadata_retries(static_cast<std::size_t>(
            parse_unsigned("ATLASFS_METADATA_RETRIES", v)));
    }
    if (const char* v = env_or_null("ATLASFS_TIMEOUT_MS")) {
        set_timeout_ms(parse_unsigned("ATLASFS_TIMEOUT_MS", v));
    }
    if (const char* v = env_or_null("ATLASFS_USER_ID")) set_user_id(v);
    if (const char* v = env_or_null("ATLASFS_LOG_LEVEL")) set_log_level(v);
    return *this;
}

ServiceConfig ServiceConfig::from_file(const std::string& path,
                                       const ServiceConfig& base) {
    utils::json::JsonParser parser;
    auto loaded = parser.load(path);
    if (loaded.error()) {
        throw std::invalid_argument("Cannot parse config file " + path + ": " +
                                    simdjson::error_message(loaded.error()));
    }
    utils::json::JsonDocument doc = loaded.value();
    if (!doc.is_object()) {
        throw std::invalid_argument("Config file " + path +
                                    " must contain a JSON object");
    }

    ServiceConfig config = base;
    using utils::json::get_string_field;
    using utils::json::get_uint64_field;
    using utils::json::has_field;

    if (has_field(doc, "data_dir"))
        config.set_data_dir(get_string_field(doc, "data_dir"));
    if (has_field(doc, "db_path"))
        config.set_db_path(get_string_field(doc, "db_path"));
    if (has_field(doc, "bucket"))
        config.set_bucket(get_string_field(doc, "bucket"));
    if (has_field(doc, "events_dir"))
        config.set_events_dir(get_string_field(doc, "events_dir"));
    if (has_field(doc, "chunk_size"))
        config.set_chunk_size(
            static_cast<std::size_t>(get_uint64_field(doc, "chunk_size")));
    if (has_field(doc, "metadata_retries"))
        config.set_metadata_retries(static_cast<std::size_t>(
            get_uint64_field(doc, "metadata_retries")));
    if (has_field(doc, "timeout_ms"))
        config.set_timeout_ms(get_uint64_field(doc, "timeout_ms"));
    if (has_field(doc, "user_id"))
        config.set_user_id(get_string_field(doc, "user_id"));
    if (has_field(doc, "log_level"))
        config.set_log_level(get_string_field(doc, "log_level"));

    ATLASFS_LOG_DEBUG("Loaded config file {}", path);
    return config;
}

void ServiceConfig::validate() const {
    if (data_dir_.empty()) {
        throw std::invalid_argument("data_dir must not be empty");
    }
    if (bucket_.empty() || bucket_.find('/') != std::string::npos ||
        bucket_ == "." || bucket_ == "..") {
        throw std::invalid_argument("bucket name '" + bucket_ +
                                    "' is not valid");
    }
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be greater than zero");
    }
    if (chunk_size_ > constants::chunker::MAX_CHUNK_SIZE) {
        throw std::invalid_argument(
            "chunk_size must not exceed " +
            std::to_string(constants::chunker::MAX_CHUNK_SIZE) + " bytes");
    }
    if (user_id_.empty()) {
        throw std::invalid_argument("user_id must not be empty");
    }
    bool known_level = false;
    for (const auto& level : LEVELS) {
        known_level = known_level || level == log_level_;
    }
    if (!known_level) {
        throw std::invalid_argument("unknown log level '" + log_level_ + "'");
    }
}

}  // namespace atlasfs
