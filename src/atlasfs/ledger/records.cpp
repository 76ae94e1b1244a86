#include <atlasfs/common/constants.h>
#include <atlasfs/ledger/error.h>
#include <atlasfs/ledger/records.h>

namespace atlasfs {

const char *to_string(FileStatus status) {
    switch (status) {
        case FileStatus::UPLOADING:
            return "uploading";
        case FileStatus::COMPLETED:
            return "completed";
        case FileStatus::FAILED:
            return "failed";
    }
    return "unknown";
}

FileStatus parse_status(const std::string &value) {
    if (value == "uploading") return FileStatus::UPLOADING;
    if (value == "completed") return FileStatus::COMPLETED;
    if (value == "failed") return FileStatus::FAILED;
    throw LedgerError(LedgerError::DATABASE_ERROR,
                      "Unknown file status '" + value + "'");
}

std::string make_chunk_id(const std::string &file_id, std::uint64_t index) {
    return file_id + constants::store::CHUNK_KEY_INFIX + std::to_string(index);
}

}  // namespace atlasfs
