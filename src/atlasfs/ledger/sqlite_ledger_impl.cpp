#include <atlasfs/common/logging.h>
#include <atlasfs/ledger/error.h>
#include <atlasfs/ledger/queries/queries.h>
#include <atlasfs/ledger/sqlite/transaction.h>
#include <atlasfs/ledger/sqlite_ledger_impl.h>

#include <algorithm>

namespace atlasfs {

static void validate_file_id(const std::string &file_id) {
    if (file_id.empty()) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "File id must not be empty");
    }
}

SqliteLedgerImplementor::SqliteLedgerImplementor(const std::string &db_path,
                                                 int busy_timeout_ms)
    : db_path(db_path), busy_timeout_ms(busy_timeout_ms) {}

void SqliteLedgerImplementor::open() {
    db.open(db_path);
    sqlite3_busy_timeout(db.get(), busy_timeout_ms);
    init_schema(db);
    ATLASFS_LOG_DEBUG("Opened ledger database {}", db_path);
}

void SqliteLedgerImplementor::apply_busy_timeout(const OperationContext &ctx) {
    std::uint64_t configured = static_cast<std::uint64_t>(
        std::max(busy_timeout_ms, 0));
    std::uint64_t remaining = ctx.remaining_ms(configured);
    sqlite3_busy_timeout(db.get(),
                         static_cast<int>(std::min(configured, remaining)));
}

void SqliteLedgerImplementor::create_file(const FileRecord &file) {
    validate_file_id(file.file_id);
    if (file.status != FileStatus::UPLOADING) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "New file '" + file.file_id +
                              "' must start in uploading state, not " +
                              to_string(file.status));
    }
    insert_file_record(db, file);
}

void SqliteLedgerImplementor::record_chunk(const ChunkRecord &chunk) {
    validate_file_id(chunk.file_id);
    if (chunk.chunk_id != make_chunk_id(chunk.file_id, chunk.chunk_index)) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "Chunk id '" + chunk.chunk_id +
                              "' does not match file and index");
    }

    switch (insert_chunk_record(db, chunk)) {
        case ChunkInsertResult::INSERTED:
            return;
        case ChunkInsertResult::DUPLICATE: {
            ChunkRecord existing;
            bool found = query_chunk_record(db, chunk.chunk_id, existing) ||
                         query_chunk_record_by_index(db, chunk.file_id,
                                                     chunk.chunk_index,
                                                     existing);
            if (found && existing.same_content(chunk)) {
                ATLASFS_LOG_DEBUG("Chunk {} already recorded", chunk.chunk_id);
                return;
            }
            throw LedgerError(LedgerError::CONFLICT,
                              "Chunk " + std::to_string(chunk.chunk_index) +
                                  " of '" + chunk.file_id +
                                  "' is already recorded with different "
                                  "content");
        }
        case ChunkInsertResult::FILE_NOT_UPLOADING: {
            FileRecord file;
            if (!query_file_record(db, chunk.file_id, file)) {
                throw LedgerError(LedgerError::NOT_FOUND,
                                  "File '" + chunk.file_id + "' not found");
            }
            throw LedgerError(LedgerError::INVALID_TRANSITION,
                              "Cannot record chunks for file '" +
                                  chunk.file_id + "' in state " +
                                  to_string(file.status));
        }
    }
}

void SqliteLedgerImplementor::finalize_file(const std::string &file_id,
                                            std::uint64_t chunk_count,
                                            std::uint64_t file_size,
                                            FileStatus status,
                                            const std::string &timestamp) {
    validate_file_id(file_id);
    if (!is_terminal(status)) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "Finalize status must be completed or failed");
    }

    SqliteTransaction txn(db);

    FileRecord current;
    if (!query_file_record(db, file_id, current)) {
        throw LedgerError(LedgerError::NOT_FOUND,
                          "File '" + file_id + "' not found");
    }
    if (current.status != FileStatus::UPLOADING) {
        throw LedgerError(LedgerError::INVALID_TRANSITION,
                          "File '" + file_id + "' is already " +
                              to_string(current.status));
    }

    if (status == FileStatus::COMPLETED) {
        ChunkSummary summary = query_chunk_summary(db, file_id);
        bool contiguous =
            summary.count == 0 ||
            (summary.min_index == 0 && summary.max_index + 1 == summary.count);
        if (summary.count != chunk_count || !contiguous ||
            summary.total_size != file_size) {
            throw LedgerError(
                LedgerError::INVALID_ARGUMENT,
                "Recorded chunks of '" + file_id + "' (" +
                    std::to_string(summary.count) + " chunks, " +
                    std::to_string(summary.total_size) +
                    " bytes) do not match completion of " +
                    std::to_string(chunk_count) + " chunks, " +
                    std::to_string(file_size) + " bytes");
        }
    }

    if (!update_file_status(db, file_id, chunk_count, file_size, status,
                            timestamp)) {
        throw LedgerError(LedgerError::INVALID_TRANSITION,
                          "File '" + file_id + "' left uploading state");
    }
    txn.commit();
}

bool SqliteLedgerImplementor::lookup_file(const std::string &file_id,
                                          FileRecord &out) {
    return query_file_record(db, file_id, out);
}

std::vector<ChunkRecord> SqliteLedgerImplementor::list_chunks(
    const std::string &file_id) {
    return query_chunk_records(db, file_id);
}

std::vector<FileRecord> SqliteLedgerImplementor::list_files(
    std::size_t limit) {
    return query_file_records(db, limit);
}

bool SqliteLedgerImplementor::delete_file(const std::string &file_id) {
    validate_file_id(file_id);
    return delete_file_record(db, file_id);
}

}  // namespace atlasfs
