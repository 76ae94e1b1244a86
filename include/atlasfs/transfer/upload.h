#ifndef ATLASFS_TRANSFER_UPLOAD_H
#define ATLASFS_TRANSFER_UPLOAD_H

#include <atlasfs/common/constants.h>
#include <atlasfs/common/context.h>
#include <atlasfs/events/event_emitter.h>
#include <atlasfs/ledger/metadata_ledger.h>
#include <atlasfs/store/chunk_store.h>
#include <atlasfs/transfer/error.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace atlasfs {

struct UploadOptions {
    std::size_t chunk_size = constants::chunker::DEFAULT_CHUNK_SIZE;
    // Extra attempts for a chunk's metadata write after its bytes are
    // stored.
    std::size_t metadata_retries = constants::ledger::DEFAULT_METADATA_RETRIES;
    int retry_backoff_ms = constants::ledger::RETRY_BACKOFF_MS;
    std::string user_id = constants::service::DEFAULT_USER_ID;
    std::string source = "upload-service";
};

struct UploadResult {
    FileRecord file;
    std::vector<ChunkRecord> chunks;
    std::uint64_t events_published = 0;
    std::uint64_t events_failed = 0;
};

/**
 * Drives Chunker -> ChunkStore -> MetadataLedger -> EventEmitter for one
 * incoming file, one chunk at a time.
 *
 * Any failure after the file row exists finalizes the file as failed,
 * publishes file.upload.failed and rethrows as TransferError. Chunks that
 * were already stored and recorded are left in place.
 */
class UploadOrchestrator {
   public:
    UploadOrchestrator(ChunkStore &store, MetadataLedger &ledger,
                       EventEmitter &events,
                       UploadOptions options = UploadOptions());

    // declared_size, when given, must match the number of bytes read or the
    // upload fails with INPUT_ERROR.
    UploadResult upload(const std::string &file_name, std::istream &input,
                        const OperationContext &ctx,
                        std::optional<std::uint64_t> declared_size =
                            std::nullopt);

    const UploadOptions &options() const { return options_; }

   private:
    ChunkStore &store_;
    MetadataLedger &ledger_;
    EventEmitter &events_;
    UploadOptions options_;

    void record_with_retries(const ChunkRecord &chunk,
                             const OperationContext &ctx);
    void publish(const Event &event, UploadResult &result);
    void mark_failed(UploadResult &result, std::uint64_t bytes_recorded,
                     const std::string &reason);
};

}  // namespace atlasfs

#endif  // ATLASFS_TRANSFER_UPLOAD_H
