#include <atlasfs/common/logging.h>
#include <atlasfs/transfer/download.h>

namespace atlasfs {

DownloadOrchestrator::DownloadOrchestrator(MetadataLedger &ledger,
                                           ChunkStore &store,
                                           EventEmitter &events,
                                           const std::string &source)
    : reassembler_(ledger, store), events_(events), source_(source) {}

ReassemblyPlan DownloadOrchestrator::prepare(const std::string &file_id,
                                             const OperationContext &ctx) {
    ReassemblyPlan plan = reassembler_.plan(file_id, ctx);
    reassembler_.check_availability(plan, ctx);
    return plan;
}

DownloadResult DownloadOrchestrator::send(const ReassemblyPlan &plan,
                                          std::ostream &out,
                                          const OperationContext &ctx) {
    StreamProgress progress;
    reassembler_.stream(plan, out, ctx, progress);

    DownloadResult result;
    result.file = plan.file;
    result.bytes_sent = progress.bytes_written;
    result.chunk_count = progress.chunks_written;

    PublishOutcome outcome = events_.publish(
        Event::create(EventType::DOWNLOAD_COMPLETED, source_,
                      plan.file.file_id,
                      {{"file_id", plan.file.file_id},
                       {"filename", plan.file.file_name},
                       {"size", plan.file.file_size},
                       {"chunk_count", plan.file.chunk_count}}));
    result.event_delivered = outcome.delivered;
    if (!outcome.delivered) {
        ATLASFS_LOG_WARN("Failed to publish download event for {}: {}",
                         plan.file.file_id, outcome.error);
    }

    ATLASFS_LOG_INFO("Download {} completed: {} bytes in {} chunks",
                     plan.file.file_id, result.bytes_sent, result.chunk_count);
    return result;
}

DownloadResult DownloadOrchestrator::download(const std::string &file_id,
                                              std::ostream &out,
                                              const OperationContext &ctx) {
    return send(prepare(file_id, ctx), out, ctx);
}

}  // namespace atlasfs
