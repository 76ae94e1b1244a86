#ifndef ATLASFS_TRANSFER_REASSEMBLER_H
#define ATLASFS_TRANSFER_REASSEMBLER_H

#include <atlasfs/common/context.h>
#include <atlasfs/ledger/metadata_ledger.h>
#include <atlasfs/store/chunk_store.h>
#include <atlasfs/transfer/error.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace atlasfs {

struct ReassemblyPlan {
    FileRecord file;
    // Ordered by index, validated against the file record.
    std::vector<ChunkRecord> chunks;
};

struct StreamProgress {
    std::uint64_t bytes_written = 0;
    std::uint64_t chunks_written = 0;
};

struct ChunkVerification {
    ChunkRecord chunk;
    bool present = false;
    std::uint64_t actual_size = 0;
    std::string actual_checksum;
    std::string error;

    bool ok() const { return present && error.empty(); }
};

struct VerificationReport {
    FileRecord file;
    std::vector<ChunkVerification> chunks;
    // Problems with the chunk list itself (count, gaps, size sum).
    std::string structure_error;
    std::uint64_t missing = 0;
    std::uint64_t corrupted = 0;

    bool ok() const {
        return structure_error.empty() && missing == 0 && corrupted == 0;
    }
};

/**
 * Turns a completed file's chunk list back into its byte stream.
 *
 * Nothing is written to the consumer until the plan has been validated and
 * every chunk object is known to exist. After that chunks are fetched one
 * at a time in index order; each is read in full and checked against its
 * recorded size and checksum before any of its bytes are written. The
 * first failure stops the stream and is thrown as TransferError carrying
 * the number of bytes already written.
 */
class Reassembler {
   public:
    Reassembler(MetadataLedger &ledger, ChunkStore &store);

    // NOT_FOUND for unknown or non-completed files (the store is not
    // touched), INTEGRITY_ERROR when the chunk list does not describe the
    // file.
    ReassemblyPlan plan(const std::string &file_id,
                        const OperationContext &ctx);

    // STORAGE_ERROR if any chunk object is missing.
    void check_availability(const ReassemblyPlan &plan,
                            const OperationContext &ctx);

    void stream(const ReassemblyPlan &plan, std::ostream &out,
                const OperationContext &ctx, StreamProgress &progress);

    // plan + check_availability + stream
    StreamProgress reassemble(const std::string &file_id, std::ostream &out,
                              const OperationContext &ctx);

    // Re-hashes every stored chunk of a file in any state. Only an unknown
    // file id throws (NOT_FOUND); everything else lands in the report.
    VerificationReport verify(const std::string &file_id,
                              const OperationContext &ctx);

    // Validates ordering, count and size sum. Throws INTEGRITY_ERROR.
    static void validate_chunks(const FileRecord &file,
                                const std::vector<ChunkRecord> &chunks);

   private:
    MetadataLedger &ledger_;
    ChunkStore &store_;
    std::vector<char> buffer_;

    // Reads the whole object into buffer_; returns the number of bytes read,
    // at most chunk.chunk_size + 1.
    std::size_t read_object(const ChunkRecord &chunk,
                            const OperationContext &ctx);
};

}  // namespace atlasfs

#endif  // ATLASFS_TRANSFER_REASSEMBLER_H
