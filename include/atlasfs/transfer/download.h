#ifndef ATLASFS_TRANSFER_DOWNLOAD_H
#define ATLASFS_TRANSFER_DOWNLOAD_H

#include <atlasfs/common/context.h>
#include <atlasfs/events/event_emitter.h>
#include <atlasfs/ledger/metadata_ledger.h>
#include <atlasfs/store/chunk_store.h>
#include <atlasfs/transfer/reassembler.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace atlasfs {

struct DownloadResult {
    FileRecord file;
    std::uint64_t bytes_sent = 0;
    std::uint64_t chunk_count = 0;
    bool event_delivered = false;
};

/**
 * MetadataLedger -> Reassembler -> EventEmitter for one download.
 *
 * prepare() does every check that can fail before the first byte, so a
 * caller can pick its response status after prepare() and before send().
 * file.download.completed is only published after the last byte was
 * written.
 */
class DownloadOrchestrator {
   public:
    DownloadOrchestrator(MetadataLedger &ledger, ChunkStore &store,
                         EventEmitter &events,
                         const std::string &source = "download-service");

    ReassemblyPlan prepare(const std::string &file_id,
                           const OperationContext &ctx);
    DownloadResult send(const ReassemblyPlan &plan, std::ostream &out,
                        const OperationContext &ctx);
    DownloadResult download(const std::string &file_id, std::ostream &out,
                            const OperationContext &ctx);

   private:
    Reassembler reassembler_;
    EventEmitter &events_;
    std::string source_;
};

}  // namespace atlasfs

#endif  // ATLASFS_TRANSFER_DOWNLOAD_H
