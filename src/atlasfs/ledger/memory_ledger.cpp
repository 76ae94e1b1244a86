#include <atlasfs/ledger/memory_ledger.h>

#include <algorithm>

namespace atlasfs {

void MemoryLedger::create_file(const FileRecord &file,
                               const OperationContext &ctx) {
    ctx.check("create_file " + file.file_id);
    if (file.file_id.empty()) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "File id must not be empty");
    }
    if (file.status != FileStatus::UPLOADING) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "New file '" + file.file_id +
                              "' must start in uploading state, not " +
                              to_string(file.status));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (files_.count(file.file_id) > 0) {
        throw LedgerError(LedgerError::CONFLICT,
                          "File '" + file.file_id + "' already exists");
    }
    files_[file.file_id] = Entry{file, next_sequence_++, {}};
}

void MemoryLedger::record_chunk(const ChunkRecord &chunk,
                                const OperationContext &ctx) {
    ctx.check("record_chunk " + chunk.chunk_id);
    if (chunk.chunk_id != make_chunk_id(chunk.file_id, chunk.chunk_index)) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "Chunk id '" + chunk.chunk_id +
                              "' does not match file and index");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(chunk.file_id);
    if (it == files_.end()) {
        throw LedgerError(LedgerError::NOT_FOUND,
                          "File '" + chunk.file_id + "' not found");
    }
    Entry &entry = it->second;

    if (entry.file.status != FileStatus::UPLOADING) {
        throw LedgerError(LedgerError::INVALID_TRANSITION,
                          "Cannot record chunks for file '" + chunk.file_id +
                              "' in state " + to_string(entry.file.status));
    }
    auto existing = entry.chunks.find(chunk.chunk_index);
    if (existing != entry.chunks.end()) {
        if (existing->second.same_content(chunk)) {
            return;
        }
        throw LedgerError(LedgerError::CONFLICT,
                          "Chunk " + std::to_string(chunk.chunk_index) +
                              " of '" + chunk.file_id +
                              "' is already recorded with different content");
    }
    entry.chunks.emplace(chunk.chunk_index, chunk);
}

void MemoryLedger::finalize_file(const std::string &file_id,
                                 std::uint64_t chunk_count,
                                 std::uint64_t file_size, FileStatus status,
                                 const std::string &timestamp,
                                 const OperationContext &ctx) {
    ctx.check("finalize_file " + file_id);
    if (!is_terminal(status)) {
        throw LedgerError(LedgerError::INVALID_ARGUMENT,
                          "Finalize status must be completed or failed");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        throw LedgerError(LedgerError::NOT_FOUND,
                          "File '" + file_id + "' not found");
    }
    Entry &entry = it->second;
    if (entry.file.status != FileStatus::UPLOADING) {
        throw LedgerError(LedgerError::INVALID_TRANSITION,
                          "File '" + file_id + "' is already " +
                              to_string(entry.file.status));
    }

    if (status == FileStatus::COMPLETED) {
        std::uint64_t total = 0;
        std::uint64_t expected_index = 0;
        bool contiguous = true;
        for (const auto &kv : entry.chunks) {
            contiguous = contiguous && kv.first == expected_index++;
            total += kv.second.chunk_size;
        }
        if (entry.chunks.size() != chunk_count || !contiguous ||
            total != file_size) {
            throw LedgerError(
                LedgerError::INVALID_ARGUMENT,
                "Recorded chunks of '" + file_id + "' (" +
                    std::to_string(entry.chunks.size()) + " chunks, " +
                    std::to_string(total) +
                    " bytes) do not match completion of " +
                    std::to_string(chunk_count) + " chunks, " +
                    std::to_string(file_size) + " bytes");
        }
    }

    entry.file.status = status;
    entry.file.chunk_count = chunk_count;
    entry.file.file_size = file_size;
    entry.file.updated_at = timestamp;
}

bool MemoryLedger::lookup_file(const std::string &file_id, FileRecord &out,
                               const OperationContext &ctx) {
    ctx.check("lookup_file " + file_id);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return false;
    }
    out = it->second.file;
    return true;
}

std::vector<ChunkRecord> MemoryLedger::list_chunks(
    const std::string &file_id, const OperationContext &ctx) {
    ctx.check("list_chunks " + file_id);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkRecord> out;
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return out;
    }
    out.reserve(it->second.chunks.size());
    for (const auto &kv : it->second.chunks) {
        out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(),
              [](const ChunkRecord &a, const ChunkRecord &b) {
                  return a.chunk_index < b.chunk_index;
              });
    return out;
}

std::vector<FileRecord> MemoryLedger::list_files(std::size_t limit,
                                                 const OperationContext &ctx) {
    ctx.check("list_files");
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const Entry *> entries;
    entries.reserve(files_.size());
    for (const auto &kv : files_) {
        entries.push_back(&kv.second);
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry *a, const Entry *b) {
                  if (a->file.created_at != b->file.created_at) {
                      return a->file.created_at > b->file.created_at;
                  }
                  return a->sequence > b->sequence;
              });

    std::vector<FileRecord> out;
    for (const Entry *entry : entries) {
        if (out.size() >= limit) break;
        out.push_back(entry->file);
    }
    return out;
}

bool MemoryLedger::delete_file(const std::string &file_id,
                               const OperationContext &ctx) {
    ctx.check("delete_file " + file_id);
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.erase(file_id) > 0;
}

}  // namespace atlasfs
