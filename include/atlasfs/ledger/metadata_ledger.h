#ifndef ATLASFS_LEDGER_METADATA_LEDGER_H
#define ATLASFS_LEDGER_METADATA_LEDGER_H

#include <atlasfs/common/constants.h>
#include <atlasfs/common/context.h>
#include <atlasfs/ledger/error.h>
#include <atlasfs/ledger/records.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace atlasfs {

/**
 * Durable record of files, their chunks and their lifecycle status.
 *
 * Rules every implementation enforces:
 *  - chunk rows are insert-only and unique per (file_id, chunk_index)
 *  - chunks can only be recorded while the file is uploading
 *  - status moves uploading -> completed or uploading -> failed, once
 *  - a file can only complete when its recorded chunks cover indices
 *    [0, chunk_count) and their sizes sum to file_size
 *
 * Violations raise LedgerError; an expired or cancelled context raises
 * TransferError before the store is touched.
 */
class MetadataLedger {
   public:
    virtual ~MetadataLedger() = default;

    // The record must be in UPLOADING state. Throws CONFLICT if the id is
    // taken.
    virtual void create_file(const FileRecord &file,
                             const OperationContext &ctx) = 0;

    // Recording a row identical to one already present succeeds without
    // changes; a different row under the same id or index throws CONFLICT.
    virtual void record_chunk(const ChunkRecord &chunk,
                              const OperationContext &ctx) = 0;

    virtual void finalize_file(const std::string &file_id,
                               std::uint64_t chunk_count,
                               std::uint64_t file_size, FileStatus status,
                               const std::string &timestamp,
                               const OperationContext &ctx) = 0;

    virtual bool lookup_file(const std::string &file_id, FileRecord &out,
                             const OperationContext &ctx) = 0;

    // Sorted by chunk_index ascending.
    virtual std::vector<ChunkRecord> list_chunks(
        const std::string &file_id, const OperationContext &ctx) = 0;

    // Newest first.
    virtual std::vector<FileRecord> list_files(
        std::size_t limit, const OperationContext &ctx) = 0;

    // Removes the file and all of its chunk rows. Returns false if unknown.
    virtual bool delete_file(const std::string &file_id,
                             const OperationContext &ctx) = 0;
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_METADATA_LEDGER_H
