#ifndef ATLASFS_TRANSFER_DELETER_H
#define ATLASFS_TRANSFER_DELETER_H

#include <atlasfs/common/context.h>
#include <atlasfs/events/event_emitter.h>
#include <atlasfs/ledger/metadata_ledger.h>
#include <atlasfs/store/chunk_store.h>

#include <cstdint>
#include <string>

namespace atlasfs {

struct DeleteResult {
    FileRecord file;
    std::uint64_t objects_removed = 0;
    std::uint64_t objects_missing = 0;
    bool event_delivered = false;
};

// Removes a file's chunk objects, then its ledger rows, then publishes
// file.deleted. Unknown ids throw TransferError(NOT_FOUND).
class FileDeleter {
   public:
    FileDeleter(MetadataLedger &ledger, ChunkStore &store,
                EventEmitter &events,
                const std::string &source = "file-service");

    DeleteResult remove(const std::string &file_id,
                        const OperationContext &ctx);

   private:
    MetadataLedger &ledger_;
    ChunkStore &store_;
    EventEmitter &events_;
    std::string source_;
};

}  // namespace atlasfs

#endif  // ATLASFS_TRANSFER_DELETER_H
