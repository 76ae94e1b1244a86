#include <atlasfs/chunker/chunker.h>
#include <atlasfs/common/logging.h>
#include <atlasfs/transfer/helpers.h>
#include <atlasfs/transfer/upload.h>
#include <atlasfs/utils/id.h>
#include <atlasfs/utils/time.h>
#include <atlasfs/utils/timer.h>

#include <chrono>
#include <thread>

namespace atlasfs {

UploadOrchestrator::UploadOrchestrator(ChunkStore &store,
                                       MetadataLedger &ledger,
                                       EventEmitter &events,
                                       UploadOptions options)
    : store_(store),
      ledger_(ledger),
      events_(events),
      options_(std::move(options)) {}

void UploadOrchestrator::publish(const Event &event, UploadResult &result) {
    PublishOutcome outcome = events_.publish(event);
    if (outcome.delivered) {
        result.events_published += 1;
    } else {
        result.events_failed += 1;
        ATLASFS_LOG_WARN("Failed to publish {} for {}: {}",
                         to_string(event.type), event.key, outcome.error);
    }
}

void UploadOrchestrator::record_with_retries(const ChunkRecord &chunk,
                                             const OperationContext &ctx) {
    for (std::size_t attempt = 0;; ++attempt) {
        ctx.check("record chunk " + chunk.chunk_id);
        try {
            ledger_.record_chunk(chunk, ctx);
            return;
        } catch (const LedgerError &e) {
            if (!is_retryable(e) || attempt >= options_.metadata_retries) {
                throw storage_failure(
                    "Recording chunk " + chunk.chunk_id + " failed after " +
                        std::to_string(attempt + 1) + " attempt(s)",
                    e);
            }
            ATLASFS_LOG_WARN("Recording chunk {} failed (attempt {}/{}): {}",
                             chunk.chunk_id, attempt + 1,
                             options_.metadata_retries + 1, e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(
                options_.retry_backoff_ms * static_cast<int>(attempt + 1)));
        }
    }
}

void UploadOrchestrator::mark_failed(UploadResult &result,
                                     std::uint64_t bytes_recorded,
                                     const std::string &reason) {
    FileRecord &file = result.file;
    std::string now = utils::now_iso8601();
    // Cleanup runs even when the request context has expired.
    OperationContext cleanup_ctx;
    try {
        ledger_.finalize_file(file.file_id, result.chunks.size(),
                              bytes_recorded, FileStatus::FAILED, now,
                              cleanup_ctx);
        file.status = FileStatus::FAILED;
        file.chunk_count = result.chunks.size();
        file.file_size = bytes_recorded;
        file.updated_at = now;
    } catch (const std::exception &e) {
        ATLASFS_LOG_ERROR("Could not mark upload {} as failed: {}",
                          file.file_id, e.what());
    }

    publish(Event::create(EventType::UPLOAD_FAILED, options_.source,
                          file.file_id,
                          {{"file_id", file.file_id},
                           {"filename", file.file_name},
                           {"chunks_stored", result.chunks.size()},
                           {"error", reason}}),
            result);
}

UploadResult UploadOrchestrator::upload(
    const std::string &file_name, std::istream &input,
    const OperationContext &ctx, std::optional<std::uint64_t> declared_size) {
    if (file_name.empty()) {
        throw TransferError(TransferError::INPUT_ERROR,
                            "File name must not be empty");
    }
    if (options_.chunk_size == 0 ||
        options_.chunk_size > Chunker::MAX_CHUNK_SIZE) {
        throw TransferError(TransferError::INPUT_ERROR,
                            "Chunk size " + std::to_string(options_.chunk_size) +
                                " is outside 1.." +
                                std::to_string(Chunker::MAX_CHUNK_SIZE));
    }
    ctx.check("upload " + file_name);

    utils::Timer timer("upload " + file_name, true, true);

    UploadResult result;
    FileRecord &file = result.file;
    file.file_id = utils::generate_file_id();
    file.file_name = file_name;
    file.file_size = declared_size.value_or(0);
    file.chunk_count = 0;
    file.status = FileStatus::UPLOADING;
    file.user_id = options_.user_id;
    file.created_at = utils::now_iso8601();
    file.updated_at = file.created_at;

    try {
        ledger_.create_file(file, ctx);
    } catch (const LedgerError &e) {
        throw storage_failure("Creating file record for " + file_name +
                                  " failed",
                              e);
    }
    ATLASFS_LOG_INFO("Upload {} started: {} (chunk size {})", file.file_id,
                     file_name, options_.chunk_size);

    publish(Event::create(EventType::UPLOAD_STARTED, options_.source,
                          file.file_id,
                          {{"file_id", file.file_id},
                           {"filename", file.file_name},
                           {"size", file.file_size},
                           {"user_id", file.user_id}}),
            result);

    std::uint64_t bytes_recorded = 0;
    try {
        Chunker chunker(input, options_.chunk_size);
        ChunkData chunk;
        while (true) {
            ctx.check("upload " + file.file_id);
            if (!chunker.next(chunk)) {
                break;
            }

            ChunkRecord record;
            record.chunk_id = make_chunk_id(file.file_id, chunk.index);
            record.file_id = file.file_id;
            record.chunk_index = chunk.index;
            record.chunk_size = chunk.size;
            record.checksum = chunk.checksum;

            try {
                store_.put(record.chunk_id, chunk.data(), chunk.size, ctx);
            } catch (const ChunkStoreError &e) {
                throw storage_failure("Storing chunk " + record.chunk_id +
                                          " failed",
                                      e);
            }

            record.created_at = utils::now_iso8601();
            record_with_retries(record, ctx);
            bytes_recorded += record.chunk_size;
            result.chunks.push_back(record);

            publish(Event::create(EventType::CHUNK_CREATED, options_.source,
                                  record.chunk_id,
                                  {{"chunk_id", record.chunk_id},
                                   {"file_id", record.file_id},
                                   {"chunk_index", record.chunk_index},
                                   {"size", record.chunk_size},
                                   {"checksum", record.checksum}}),
                    result);
            ATLASFS_LOG_DEBUG("Chunk {} stored ({} bytes)", record.chunk_id,
                              record.chunk_size);
        }

        if (declared_size && *declared_size != chunker.bytes_consumed()) {
            throw TransferError(
                TransferError::INPUT_ERROR,
                "Received " + std::to_string(chunker.bytes_consumed()) +
                    " bytes but " + std::to_string(*declared_size) +
                    " were declared");
        }

        std::string now = utils::now_iso8601();
        ctx.check("upload " + file.file_id);
        try {
            ledger_.finalize_file(file.file_id, result.chunks.size(),
                                  bytes_recorded, FileStatus::COMPLETED, now,
                                  ctx);
        } catch (const LedgerError &e) {
            throw storage_failure("Completing " + file.file_id + " failed", e);
        }
        file.status = FileStatus::COMPLETED;
        file.chunk_count = result.chunks.size();
        file.file_size = bytes_recorded;
        file.updated_at = now;
    } catch (const TransferError &e) {
        ATLASFS_LOG_ERROR("Upload {} failed after {} chunks: {}", file.file_id,
                          result.chunks.size(), e.what());
        mark_failed(result, bytes_recorded, e.what());
        throw;
    } catch (const std::exception &e) {
        ATLASFS_LOG_ERROR("Upload {} aborted: {}", file.file_id, e.what());
        mark_failed(result, bytes_recorded, e.what());
        throw;
    }

    publish(Event::create(EventType::UPLOAD_COMPLETED, options_.source,
                          file.file_id,
                          {{"file_id", file.file_id},
                           {"filename", file.file_name},
                           {"size", file.file_size},
                           {"chunk_count", file.chunk_count},
                           {"user_id", file.user_id}}),
            result);

    ATLASFS_LOG_INFO("Upload {} completed: {} bytes in {} chunks", file.file_id,
                     file.file_size, file.chunk_count);
    return result;
}

}  // namespace atlasfs
