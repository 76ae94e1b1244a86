#ifndef ATLASFS_COMMON_CONSTANTS_H
#define ATLASFS_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace atlasfs::constants {
namespace chunker {
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;  // 4MB
static constexpr std::size_t MAX_CHUNK_SIZE = 256 * 1024 * 1024;    // 256MB
}  // namespace chunker

namespace store {
static constexpr const char *DEFAULT_BUCKET = "atlasfs-chunks";
static constexpr const char *CHUNK_KEY_INFIX = "_chunk_";
static constexpr const char *PARTIAL_SUFFIX = ".part";
static constexpr std::size_t FILE_IO_BUFFER_SIZE = 262144;  // 256KB
}  // namespace store

namespace ledger {
static constexpr std::size_t DEFAULT_METADATA_RETRIES = 3;
static constexpr std::size_t DEFAULT_LIST_LIMIT = 1000;
static constexpr int DEFAULT_BUSY_TIMEOUT_MS = 5000;
static constexpr int RETRY_BACKOFF_MS = 50;
extern const char *SQL_SCHEMA;
}  // namespace ledger

namespace events {
static constexpr const char *TOPIC = "file.events";
static constexpr const char *TOPIC_FILE_EXTENSION = ".jsonl";
}  // namespace events

namespace service {
static constexpr const char *DEFAULT_DATA_DIR = "atlasfs-data";
static constexpr const char *DEFAULT_DB_FILE = "atlasfs.sqlite";
static constexpr const char *DEFAULT_EVENTS_DIR = "events";
static constexpr const char *DEFAULT_USER_ID = "anonymous";
static constexpr std::uint64_t DEFAULT_TIMEOUT_MS = 30000;
}  // namespace service
}  // namespace atlasfs::constants

#endif  // ATLASFS_COMMON_CONSTANTS_H
