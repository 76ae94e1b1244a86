#ifndef ATLASFS_SERVICE_CONFIG_H
#define ATLASFS_SERVICE_CONFIG_H

#include <atlasfs/common/constants.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace atlasfs {

using namespace atlasfs::constants;

class ServiceConfig {
   public:
    ServiceConfig(const std::string& data_dir = service::DEFAULT_DATA_DIR,
                  std::size_t chunk_size = chunker::DEFAULT_CHUNK_SIZE,
                  std::uint64_t timeout_ms = service::DEFAULT_TIMEOUT_MS)
        : data_dir_(data_dir),
          bucket_(store::DEFAULT_BUCKET),
          chunk_size_(chunk_size),
          metadata_retries_(ledger::DEFAULT_METADATA_RETRIES),
          timeout_ms_(timeout_ms),
          user_id_(service::DEFAULT_USER_ID),
          log_level_("info") {}

    inline static ServiceConfig Default() { return ServiceConfig(); }

    // Defaults overridden by ATLASFS_* environment variables.
    static ServiceConfig from_env();

    // Overlays keys found in a JSON object file onto `base`. Keys use the
    // setter names: data_dir, db_path, bucket, events_dir, chunk_size,
    // metadata_retries, timeout_ms, user_id, log_level.
    static ServiceConfig from_file(const std::string& path,
                                   const ServiceConfig& base = Default());

    // Overlays ATLASFS_* environment variables onto this config.
    ServiceConfig& apply_env();

    // Throws std::invalid_argument on unusable values.
    void validate() const;

    ServiceConfig(const ServiceConfig&) = default;
    ServiceConfig& operator=(const ServiceConfig&) = default;
    ServiceConfig(ServiceConfig&&) = default;
    ServiceConfig& operator=(ServiceConfig&&) = default;

    // Getter
    inline const std::string& data_dir() const { return data_dir_; }
    // <data_dir>/atlasfs.sqlite unless set explicitly.
    std::string db_path() const;
    inline const std::string& bucket() const { return bucket_; }
    // <data_dir>/events unless set explicitly.
    std::string events_dir() const;
    inline std::size_t chunk_size() const { return chunk_size_; }
    inline std::size_t metadata_retries() const { return metadata_retries_; }
    inline std::uint64_t timeout_ms() const { return timeout_ms_; }
    inline const std::string& user_id() const { return user_id_; }
    inline const std::string& log_level() const { return log_level_; }

    // Setter
    inline ServiceConfig& set_data_dir(const std::string& data_dir) {
        data_dir_ = data_dir;
        return *this;
    }
    inline ServiceConfig& set_db_path(const std::string& db_path) {
        db_path_ = db_path;
        return *this;
    }
    inline ServiceConfig& set_bucket(const std::string& bucket) {
        bucket_ = bucket;
        return *this;
    }
    inline ServiceConfig& set_events_dir(const std::string& events_dir) {
        events_dir_ = events_dir;
        return *this;
    }
    inline ServiceConfig& set_chunk_size(std::size_t chunk_size) {
        chunk_size_ = chunk_size;
        return *this;
    }
    inline ServiceConfig& set_metadata_retries(std::size_t retries) {
        metadata_retries_ = retries;
        return *this;
    }
    inline ServiceConfig& set_timeout_ms(std::uint64_t timeout_ms) {
        timeout_ms_ = timeout_ms;
        return *this;
    }
    inline ServiceConfig& set_user_id(const std::string& user_id) {
        user_id_ = user_id;
        return *this;
    }
    inline ServiceConfig& set_log_level(const std::string& log_level) {
        log_level_ = log_level;
        return *this;
    }

   private:
    std::string data_dir_;
    std::string db_path_;
    std::string bucket_;
    std::string events_dir_;
    std::size_t chunk_size_;
    std::size_t metadata_retries_;
    std::uint64_t timeout_ms_;
    std::string user_id_;
    std::string log_level_;
};

}  // namespace atlasfs

#endif  // ATLASFS_SERVICE_CONFIG_H
