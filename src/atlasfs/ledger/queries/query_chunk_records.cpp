#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

ChunkRecord read_chunk_row(SqliteStmt &stmt) {
    ChunkRecord chunk;
    chunk.chunk_id = stmt.column_text(0);
    chunk.file_id = stmt.column_text(1);
    chunk.chunk_index = stmt.column_uint64(2);
    chunk.chunk_size = stmt.column_uint64(3);
    chunk.checksum = stmt.column_text(4);
    chunk.created_at = stmt.column_text(5);
    return chunk;
}

bool query_chunk_record(const SqliteDatabase &db, const std::string &chunk_id,
                        ChunkRecord &out) {
    SqliteStmt stmt(db,
                    "SELECT chunk_id, file_id, chunk_index, chunk_size, "
                    "checksum, created_at FROM chunks "
                    "WHERE chunk_id = ? LIMIT 1;");
    stmt.bind_text(1, chunk_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        out = read_chunk_row(stmt);
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Lookup of chunk '" + chunk_id + "' failed");
    }
    return false;
}

bool query_chunk_record_by_index(const SqliteDatabase &db,
                                 const std::string &file_id,
                                 std::uint64_t chunk_index, ChunkRecord &out) {
    SqliteStmt stmt(db,
                    "SELECT chunk_id, file_id, chunk_index, chunk_size, "
                    "checksum, created_at FROM chunks "
                    "WHERE file_id = ? AND chunk_index = ? LIMIT 1;");
    stmt.bind_text(1, file_id);
    stmt.bind_int64(2, chunk_index);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        out = read_chunk_row(stmt);
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc,
                         "Lookup of chunk " + std::to_string(chunk_index) +
                             " of '" + file_id + "' failed");
    }
    return false;
}

std::vector<ChunkRecord> query_chunk_records(const SqliteDatabase &db,
                                             const std::string &file_id) {
    SqliteStmt stmt(db,
                    "SELECT chunk_id, file_id, chunk_index, chunk_size, "
                    "checksum, created_at FROM chunks "
                    "WHERE file_id = ? ORDER BY chunk_index ASC;");
    stmt.bind_text(1, file_id);

    std::vector<ChunkRecord> chunks;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        chunks.push_back(read_chunk_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Listing chunks of '" + file_id + "' failed");
    }
    return chunks;
}

ChunkSummary query_chunk_summary(const SqliteDatabase &db,
                                 const std::string &file_id) {
    SqliteStmt stmt(db,
                    "SELECT COUNT(*), COALESCE(SUM(chunk_size), 0), "
                    "COALESCE(MIN(chunk_index), 0), "
                    "COALESCE(MAX(chunk_index), 0) "
                    "FROM chunks WHERE file_id = ?;");
    stmt.bind_text(1, file_id);

    ChunkSummary summary;
    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        throw_step_error(db, rc,
                         "Summarizing chunks of '" + file_id + "' failed");
    }
    summary.count = stmt.column_uint64(0);
    summary.total_size = stmt.column_uint64(1);
    summary.min_index = stmt.column_uint64(2);
    summary.max_index = stmt.column_uint64(3);
    return summary;
}

}  // namespace atlasfs
