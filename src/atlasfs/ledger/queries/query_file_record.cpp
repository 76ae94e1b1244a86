#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

FileRecord read_file_row(SqliteStmt &stmt) {
    FileRecord file;
    file.file_id = stmt.column_text(0);
    file.file_name = stmt.column_text(1);
    file.file_size = stmt.column_uint64(2);
    file.chunk_count = stmt.column_uint64(3);
    file.status = parse_status(stmt.column_text(4));
    file.user_id = stmt.column_text(5);
    file.created_at = stmt.column_text(6);
    file.updated_at = stmt.column_text(7);
    return file;
}

bool query_file_record(const SqliteDatabase &db, const std::string &file_id,
                       FileRecord &out) {
    SqliteStmt stmt(db,
                    "SELECT file_id, file_name, file_size, chunk_count, "
                    "status, user_id, created_at, updated_at "
                    "FROM files WHERE file_id = ? LIMIT 1;");
    stmt.bind_text(1, file_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        out = read_file_row(stmt);
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Lookup of file '" + file_id + "' failed");
    }
    return false;
}

std::vector<FileRecord> query_file_records(const SqliteDatabase &db,
                                           std::size_t limit) {
    SqliteStmt stmt(db,
                    "SELECT file_id, file_name, file_size, chunk_count, "
                    "status, user_id, created_at, updated_at "
                    "FROM files ORDER BY created_at DESC, rowid DESC "
                    "LIMIT ?;");
    stmt.bind_int64(1, limit);

    std::vector<FileRecord> files;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        files.push_back(read_file_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Listing files failed");
    }
    return files;
}

}  // namespace atlasfs
