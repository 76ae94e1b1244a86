#ifndef ATLASFS_LEDGER_MEMORY_LEDGER_H
#define ATLASFS_LEDGER_MEMORY_LEDGER_H

#include <atlasfs/ledger/metadata_ledger.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace atlasfs {

// In-process ledger with the same rules as SqliteLedger.
class MemoryLedger : public MetadataLedger {
   public:
    MemoryLedger() = default;

    void create_file(const FileRecord &file,
                     const OperationContext &ctx) override;
    void record_chunk(const ChunkRecord &chunk,
                      const OperationContext &ctx) override;
    void finalize_file(const std::string &file_id, std::uint64_t chunk_count,
                       std::uint64_t file_size, FileStatus status,
                       const std::string &timestamp,
                       const OperationContext &ctx) override;
    bool lookup_file(const std::string &file_id, FileRecord &out,
                     const OperationContext &ctx) override;
    std::vector<ChunkRecord> list_chunks(const std::string &file_id,
                                         const OperationContext &ctx) override;
    std::vector<FileRecord> list_files(std::size_t limit,
                                       const OperationContext &ctx) override;
    bool delete_file(const std::string &file_id,
                     const OperationContext &ctx) override;

   private:
    struct Entry {
        FileRecord file;
        std::uint64_t sequence;
        // Keyed by chunk index.
        std::map<std::uint64_t, ChunkRecord> chunks;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> files_;
    std::uint64_t next_sequence_ = 0;
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_MEMORY_LEDGER_H
