#ifndef ATLASFS_LEDGER_QUERIES_QUERIES_H
#define ATLASFS_LEDGER_QUERIES_QUERIES_H

#include <atlasfs/ledger/records.h>
#include <atlasfs/ledger/sqlite/database.h>
#include <atlasfs/ledger/sqlite/statement.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace atlasfs {

struct ChunkSummary {
    std::uint64_t count = 0;
    std::uint64_t total_size = 0;
    std::uint64_t min_index = 0;
    std::uint64_t max_index = 0;
};

enum class ChunkInsertResult { INSERTED, FILE_NOT_UPLOADING, DUPLICATE };

// Throws LedgerError: UNAVAILABLE for SQLITE_BUSY/LOCKED, DATABASE_ERROR
// otherwise.
[[noreturn]] void throw_step_error(const SqliteDatabase &db, int rc,
                                   const std::string &what);

void init_schema(const SqliteDatabase &db);

void insert_file_record(const SqliteDatabase &db, const FileRecord &file);

ChunkInsertResult insert_chunk_record(const SqliteDatabase &db,
                                      const ChunkRecord &chunk);

FileRecord read_file_row(SqliteStmt &stmt);
ChunkRecord read_chunk_row(SqliteStmt &stmt);

bool query_file_record(const SqliteDatabase &db, const std::string &file_id,
                       FileRecord &out);
std::vector<FileRecord> query_file_records(const SqliteDatabase &db,
                                           std::size_t limit);

bool query_chunk_record(const SqliteDatabase &db, const std::string &chunk_id,
                        ChunkRecord &out);
bool query_chunk_record_by_index(const SqliteDatabase &db,
                                 const std::string &file_id,
                                 std::uint64_t chunk_index, ChunkRecord &out);
std::vector<ChunkRecord> query_chunk_records(const SqliteDatabase &db,
                                             const std::string &file_id);
ChunkSummary query_chunk_summary(const SqliteDatabase &db,
                                 const std::string &file_id);

// Only touches a row still in 'uploading'. Returns false if none matched.
bool update_file_status(const SqliteDatabase &db, const std::string &file_id,
                        std::uint64_t chunk_count, std::uint64_t file_size,
                        FileStatus status, const std::string &timestamp);

bool delete_file_record(const SqliteDatabase &db, const std::string &file_id);

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_QUERIES_QUERIES_H
