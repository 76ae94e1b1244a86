#include <atlasfs/common/logging.h>
#include <atlasfs/ledger/sqlite_ledger.h>
#include <atlasfs/ledger/sqlite_ledger_impl.h>

namespace atlasfs {

SqliteLedger::SqliteLedger(const std::string &db_path, int busy_timeout_ms)
    : p_impl_(std::make_unique<SqliteLedgerImplementor>(db_path,
                                                        busy_timeout_ms)) {
    p_impl_->open();
}

SqliteLedger::~SqliteLedger() = default;

void SqliteLedger::create_file(const FileRecord &file,
                               const OperationContext &ctx) {
    ctx.check("create_file " + file.file_id);
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    p_impl_->create_file(file);
    ATLASFS_LOG_DEBUG("Created file record {} ({})", file.file_id,
                      file.file_name);
}

void SqliteLedger::record_chunk(const ChunkRecord &chunk,
                                const OperationContext &ctx) {
    ctx.check("record_chunk " + chunk.chunk_id);
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    p_impl_->record_chunk(chunk);
}

void SqliteLedger::finalize_file(const std::string &file_id,
                                 std::uint64_t chunk_count,
                                 std::uint64_t file_size, FileStatus status,
                                 const std::string &timestamp,
                                 const OperationContext &ctx) {
    ctx.check("finalize_file " + file_id);
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    p_impl_->finalize_file(file_id, chunk_count, file_size, status, timestamp);
    ATLASFS_LOG_DEBUG("File {} finalized as {}", file_id, to_string(status));
}

bool SqliteLedger::lookup_file(const std::string &file_id, FileRecord &out,
                               const OperationContext &ctx) {
    ctx.check("lookup_file " + file_id);
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    return p_impl_->lookup_file(file_id, out);
}

std::vector<ChunkRecord> SqliteLedger::list_chunks(
    const std::string &file_id, const OperationContext &ctx) {
    ctx.check("list_chunks " + file_id);
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    return p_impl_->list_chunks(file_id);
}

std::vector<FileRecord> SqliteLedger::list_files(std::size_t limit,
                                                 const OperationContext &ctx) {
    ctx.check("list_files");
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    return p_impl_->list_files(limit);
}

bool SqliteLedger::delete_file(const std::string &file_id,
                               const OperationContext &ctx) {
    ctx.check("delete_file " + file_id);
    std::lock_guard<std::mutex> lock(p_impl_->mutex);
    p_impl_->apply_busy_timeout(ctx);
    return p_impl_->delete_file(file_id);
}

const std::string &SqliteLedger::get_db_path() const {
    return p_impl_->db_path;
}

}  // namespace atlasfs
