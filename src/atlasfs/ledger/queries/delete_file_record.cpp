#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

bool delete_file_record(const SqliteDatabase &db, const std::string &file_id) {
    SqliteStmt stmt(db, "DELETE FROM files WHERE file_id = ?;");
    stmt.bind_text(1, file_id);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc, "Deleting file '" + file_id + "' failed");
    }
    return db.changes() > 0;
}

}  // namespace atlasfs
