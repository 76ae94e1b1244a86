#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

void insert_file_record(const SqliteDatabase &db, const FileRecord &file) {
    SqliteStmt stmt(db,
                    "INSERT INTO files(file_id, file_name, file_size, "
                    "chunk_count, status, user_id, created_at, updated_at) "
                    "VALUES(?, ?, ?, ?, ?, ?, ?, ?);");

    stmt.bind_text(1, file.file_id);
    stmt.bind_text(2, file.file_name);
    stmt.bind_int64(3, file.file_size);
    stmt.bind_int64(4, file.chunk_count);
    stmt.bind_text(5, to_string(file.status));
    stmt.bind_text(6, file.user_id);
    stmt.bind_text(7, file.created_at);
    stmt.bind_text(8, file.updated_at);

    int rc = stmt.step();
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw LedgerError(LedgerError::CONFLICT,
                          "File '" + file.file_id + "' already exists");
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Insert of file '" + file.file_id + "' failed");
    }
}

}  // namespace atlasfs
