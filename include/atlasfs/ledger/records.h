#ifndef ATLASFS_LEDGER_RECORDS_H
#define ATLASFS_LEDGER_RECORDS_H

#include <cstdint>
#include <string>

namespace atlasfs {

enum class FileStatus { UPLOADING, COMPLETED, FAILED };

const char *to_string(FileStatus status);

// Throws LedgerError(DATABASE_ERROR) for anything but the three known values.
FileStatus parse_status(const std::string &value);

inline bool is_terminal(FileStatus status) {
    return status != FileStatus::UPLOADING;
}

struct FileRecord {
    std::string file_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_count = 0;
    FileStatus status = FileStatus::UPLOADING;
    std::string user_id;
    std::string created_at;
    std::string updated_at;
};

struct ChunkRecord {
    std::string chunk_id;
    std::string file_id;
    std::uint64_t chunk_index = 0;
    std::uint64_t chunk_size = 0;
    std::string checksum;
    std::string created_at;

    // Same identity and content; created_at is not compared.
    bool same_content(const ChunkRecord &other) const {
        return chunk_id == other.chunk_id && file_id == other.file_id &&
               chunk_index == other.chunk_index &&
               chunk_size == other.chunk_size && checksum == other.checksum;
    }
};

// "{file_id}_chunk_{index}", used both as ledger key and object key.
std::string make_chunk_id(const std::string &file_id, std::uint64_t index);

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_RECORDS_H
