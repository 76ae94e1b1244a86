#include <atlasfs/common/logging.h>
#include <atlasfs/transfer/deleter.h>
#include <atlasfs/transfer/helpers.h>

#include <vector>

namespace atlasfs {

FileDeleter::FileDeleter(MetadataLedger &ledger, ChunkStore &store,
                         EventEmitter &events, const std::string &source)
    : ledger_(ledger), store_(store), events_(events), source_(source) {}

DeleteResult FileDeleter::remove(const std::string &file_id,
                                 const OperationContext &ctx) {
    ctx.check("delete " + file_id);

    DeleteResult result;
    std::vector<ChunkRecord> chunks;
    try {
        if (!ledger_.lookup_file(file_id, result.file, ctx)) {
            throw TransferError(TransferError::NOT_FOUND,
                                "File '" + file_id + "' not found");
        }
        chunks = ledger_.list_chunks(file_id, ctx);
    } catch (const LedgerError &e) {
        throw storage_failure("Reading metadata of '" + file_id + "' failed",
                              e);
    }

    std::vector<std::string> keys;
    keys.reserve(chunks.size() + 1);
    for (const auto &chunk : chunks) {
        keys.push_back(chunk.chunk_id);
    }
    // An interrupted upload can leave the object of its next chunk stored
    // without a row.
    if (result.file.status != FileStatus::COMPLETED) {
        keys.push_back(make_chunk_id(file_id, chunks.size()));
    }

    for (const auto &key : keys) {
        ctx.check("delete " + file_id);
        try {
            if (store_.remove(key, ctx)) {
                result.objects_removed += 1;
            } else {
                result.objects_missing += 1;
            }
        } catch (const ChunkStoreError &e) {
            throw storage_failure("Removing object " + key + " failed", e);
        }
    }

    try {
        ledger_.delete_file(file_id, ctx);
    } catch (const LedgerError &e) {
        throw storage_failure("Deleting records of '" + file_id + "' failed",
                              e);
    }

    PublishOutcome outcome = events_.publish(
        Event::create(EventType::FILE_DELETED, source_, file_id,
                      {{"file_id", file_id},
                       {"filename", result.file.file_name},
                       {"chunk_count", chunks.size()}}));
    result.event_delivered = outcome.delivered;
    if (!outcome.delivered) {
        ATLASFS_LOG_WARN("Failed to publish delete event for {}: {}", file_id,
                         outcome.error);
    }

    ATLASFS_LOG_INFO("Deleted {}: {} objects removed, {} already missing",
                     file_id, result.objects_removed, result.objects_missing);
    return result;
}

}  // namespace atlasfs
