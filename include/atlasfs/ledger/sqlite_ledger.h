#ifndef ATLASFS_LEDGER_SQLITE_LEDGER_H
#define ATLASFS_LEDGER_SQLITE_LEDGER_H

#include <atlasfs/common/constants.h>
#include <atlasfs/ledger/metadata_ledger.h>

#include <memory>
#include <string>

namespace atlasfs {

struct SqliteLedgerImplementor;

/**
 * MetadataLedger over a single sqlite3 connection. Calls are serialized by
 * an internal mutex; the database runs in WAL mode with foreign keys on so
 * deleting a file cascades to its chunk rows. Pass ":memory:" for a
 * throwaway ledger.
 */
class SqliteLedger : public MetadataLedger {
   public:
    static constexpr int DEFAULT_BUSY_TIMEOUT_MS =
        constants::ledger::DEFAULT_BUSY_TIMEOUT_MS;

    // Throws LedgerError(UNAVAILABLE) if the database cannot be opened and
    // LedgerError(DATABASE_ERROR) if the schema cannot be created.
    explicit SqliteLedger(const std::string &db_path,
                          int busy_timeout_ms = DEFAULT_BUSY_TIMEOUT_MS);
    ~SqliteLedger() override;
    SqliteLedger(const SqliteLedger &) = delete;
    SqliteLedger &operator=(const SqliteLedger &) = delete;

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

    const std::string &get_db_path() const;

   private:
    std::unique_ptr<SqliteLedgerImplementor> p_impl_;
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_SQLITE_LEDGER_H
