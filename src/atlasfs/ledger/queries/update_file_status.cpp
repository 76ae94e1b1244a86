#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

bool update_file_status(const SqliteDatabase &db, const std::string &file_id,
                        std::uint64_t chunk_count, std::uint64_t file_size,
                        FileStatus status, const std::string &timestamp) {
    SqliteStmt stmt(db,
                    "UPDATE files SET status = ?, chunk_count = ?, "
                    "file_size = ?, updated_at = ? "
                    "WHERE file_id = ? AND status = 'uploading';");

    stmt.bind_text(1, to_string(status));
    stmt.bind_int64(2, chunk_count);
    stmt.bind_int64(3, file_size);
    stmt.bind_text(4, timestamp);
    stmt.bind_text(5, file_id);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Finalizing file '" + file_id + "' failed");
    }
    return db.changes() > 0;
}

}  // namespace atlasfs
