#ifndef ATLASFS_LEDGER_SQLITE_LEDGER_IMPL_H
#define ATLASFS_LEDGER_SQLITE_LEDGER_IMPL_H

#include <atlasfs/common/context.h>
#include <atlasfs/ledger/records.h>
#include <atlasfs/ledger/sqlite/database.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace atlasfs {

struct SqliteLedgerImplementor {
    std::string db_path;
    int busy_timeout_ms;
    std::mutex mutex;
    SqliteDatabase db;

    SqliteLedgerImplementor(const std::string &db_path, int busy_timeout_ms);

    void open();
    // Caps the sqlite busy handler at what is left of the context deadline.
    void apply_busy_timeout(const OperationContext &ctx);

    void create_file(const FileRecord &file);
    void record_chunk(const ChunkRecord &chunk);
    void finalize_file(const std::string &file_id, std::uint64_t chunk_count,
                       std::uint64_t file_size, FileStatus status,
                       const std::string &timestamp);
    bool lookup_file(const std::string &file_id, FileRecord &out);
    std::vector<ChunkRecord> list_chunks(const std::string &file_id);
    std::vector<FileRecord> list_files(std::size_t limit);
    bool delete_file(const std::string &file_id);
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_SQLITE_LEDGER_IMPL_H
