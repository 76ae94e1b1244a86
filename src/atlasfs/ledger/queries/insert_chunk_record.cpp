#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

ChunkInsertResult insert_chunk_record(const SqliteDatabase &db,
                                      const ChunkRecord &chunk) {
    // The EXISTS guard keeps the status check and the insert in one
    // statement.
    SqliteStmt stmt(db,
                    "INSERT INTO chunks(chunk_id, file_id, chunk_index, "
                    "chunk_size, checksum, created_at) "
                    "SELECT ?, ?, ?, ?, ?, ? WHERE EXISTS ("
                    "SELECT 1 FROM files WHERE file_id = ? AND "
                    "status = 'uploading');");

    stmt.bind_text(1, chunk.chunk_id);
    stmt.bind_text(2, chunk.file_id);
    stmt.bind_int64(3, chunk.chunk_index);
    stmt.bind_int64(4, chunk.chunk_size);
    stmt.bind_text(5, chunk.checksum);
    stmt.bind_text(6, chunk.created_at);
    stmt.bind_text(7, chunk.file_id);

    int rc = stmt.step();
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return ChunkInsertResult::DUPLICATE;
    }
    if (rc != SQLITE_DONE) {
        throw_step_error(db, rc,
                         "Insert of chunk '" + chunk.chunk_id + "' failed");
    }
    return db.changes() > 0 ? ChunkInsertResult::INSERTED
                            : ChunkInsertResult::FILE_NOT_UPLOADING;
}

}  // namespace atlasfs
