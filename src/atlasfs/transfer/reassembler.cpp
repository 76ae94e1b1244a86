#include <atlasfs/common/constants.h>
#include <atlasfs/common/logging.h>
#include <atlasfs/transfer/helpers.h>
#include <atlasfs/transfer/reassembler.h>
#include <atlasfs/utils/hash.h>

namespace atlasfs {

Reassembler::Reassembler(MetadataLedger &ledger, ChunkStore &store)
    : ledger_(ledger), store_(store) {}

void Reassembler::validate_chunks(const FileRecord &file,
                                  const std::vector<ChunkRecord> &chunks) {
    if (chunks.size() != file.chunk_count) {
        throw TransferError(TransferError::INTEGRITY_ERROR,
                            "File '" + file.file_id + "' expects " +
                                std::to_string(file.chunk_count) +
                                " chunks but " + std::to_string(chunks.size()) +
                                " are recorded");
    }
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].chunk_index != i) {
            throw TransferError(TransferError::INTEGRITY_ERROR,
                                "File '" + file.file_id +
                                    "' is missing chunk " + std::to_string(i));
        }
        total += chunks[i].chunk_size;
    }
    if (total != file.file_size) {
        throw TransferError(TransferError::INTEGRITY_ERROR,
                            "Chunks of '" + file.file_id + "' hold " +
                                std::to_string(total) + " bytes, file size is " +
                                std::to_string(file.file_size));
    }
}

ReassemblyPlan Reassembler::plan(const std::string &file_id,
                                 const OperationContext &ctx) {
    ctx.check("download " + file_id);

    ReassemblyPlan plan;
    bool found = false;
    try {
        found = ledger_.lookup_file(file_id, plan.file, ctx);
    } catch (const LedgerError &e) {
        throw storage_failure("Lookup of '" + file_id + "' failed", e);
    }
    if (!found || plan.file.status != FileStatus::COMPLETED) {
        throw TransferError(TransferError::NOT_FOUND,
                            "File '" + file_id + "' not found");
    }

    ctx.check("download " + file_id);
    try {
        plan.chunks = ledger_.list_chunks(file_id, ctx);
    } catch (const LedgerError &e) {
        throw storage_failure("Listing chunks of '" + file_id + "' failed", e);
    }
    validate_chunks(plan.file, plan.chunks);
    return plan;
}

void Reassembler::check_availability(const ReassemblyPlan &plan,
                                     const OperationContext &ctx) {
    for (const auto &chunk : plan.chunks) {
        ctx.check("download " + plan.file.file_id);
        bool present = false;
        try {
            present = store_.exists(chunk.chunk_id, ctx);
        } catch (const ChunkStoreError &e) {
            throw storage_failure("Cannot check chunk " + chunk.chunk_id, e);
        }
        if (!present) {
            throw TransferError(TransferError::STORAGE_ERROR,
                                "Chunk " + chunk.chunk_id +
                                    " is missing from the object store");
        }
    }
}

std::size_t Reassembler::read_object(const ChunkRecord &chunk,
                                     const OperationContext &ctx) {
    if (chunk.chunk_size > constants::chunker::MAX_CHUNK_SIZE) {
        throw TransferError(TransferError::INTEGRITY_ERROR,
                            "Chunk " + chunk.chunk_id + " records " +
                                std::to_string(chunk.chunk_size) +
                                " bytes, above the maximum chunk size");
    }

    std::unique_ptr<std::istream> in;
    try {
        in = store_.get(chunk.chunk_id, ctx);
    } catch (const ChunkStoreError &e) {
        throw storage_failure("Cannot fetch chunk " + chunk.chunk_id, e);
    }

    // One extra byte reveals objects longer than recorded.
    std::size_t want = static_cast<std::size_t>(chunk.chunk_size) + 1;
    if (buffer_.size() < want) {
        buffer_.resize(want);
    }
    in->read(buffer_.data(), static_cast<std::streamsize>(want));
    if (in->bad()) {
        throw TransferError(TransferError::STORAGE_ERROR,
                            "Read error on chunk " + chunk.chunk_id);
    }
    return static_cast<std::size_t>(in->gcount());
}

void Reassembler::stream(const ReassemblyPlan &plan, std::ostream &out,
                         const OperationContext &ctx,
                         StreamProgress &progress) {
    try {
        for (const auto &chunk : plan.chunks) {
            ctx.check("download " + plan.file.file_id);
            std::size_t got = read_object(chunk, ctx);
            if (got != chunk.chunk_size) {
                throw TransferError(TransferError::INTEGRITY_ERROR,
                                    "Chunk " + chunk.chunk_id + " holds " +
                                        (got > chunk.chunk_size
                                             ? "more than"
                                             : std::to_string(got) + " of") +
                                        " " + std::to_string(chunk.chunk_size) +
                                        " recorded bytes");
            }
            std::string checksum = utils::sha256_hex(buffer_.data(), got);
            if (checksum != chunk.checksum) {
                throw TransferError(TransferError::INTEGRITY_ERROR,
                                    "Checksum mismatch on chunk " +
                                        chunk.chunk_id + ": expected " +
                                        chunk.checksum + ", got " + checksum);
            }

            out.write(buffer_.data(), static_cast<std::streamsize>(got));
            if (!out) {
                throw TransferError(TransferError::CANCELLED,
                                    "Consumer stopped accepting bytes");
            }
            progress.bytes_written += got;
            progress.chunks_written += 1;
            ATLASFS_LOG_TRACE("Sent chunk {} ({} bytes)", chunk.chunk_id, got);
        }
        out.flush();
    } catch (TransferError &e) {
        e.set_bytes_written(progress.bytes_written);
        ATLASFS_LOG_ERROR("Stream of '{}' aborted after {} of {} bytes: {}",
                          plan.file.file_id, progress.bytes_written,
                          plan.file.file_size, e.what());
        throw;
    }
}

StreamProgress Reassembler::reassemble(const std::string &file_id,
                                       std::ostream &out,
                                       const OperationContext &ctx) {
    ReassemblyPlan p = plan(file_id, ctx);
    check_availability(p, ctx);
    StreamProgress progress;
    stream(p, out, ctx, progress);
    return progress;
}

VerificationReport Reassembler::verify(const std::string &file_id,
                                       const OperationContext &ctx) {
    ctx.check("verify " + file_id);

    VerificationReport report;
    std::vector<ChunkRecord> chunks;
    try {
        if (!ledger_.lookup_file(file_id, report.file, ctx)) {
            throw TransferError(TransferError::NOT_FOUND,
                                "File '" + file_id + "' not found");
        }
        chunks = ledger_.list_chunks(file_id, ctx);
    } catch (const LedgerError &e) {
        throw storage_failure("Reading metadata of '" + file_id + "' failed",
                              e);
    }

    if (report.file.status == FileStatus::COMPLETED) {
        try {
            validate_chunks(report.file, chunks);
        } catch (const TransferError &e) {
            report.structure_error = e.what();
        }
    }

    for (const auto &chunk : chunks) {
        ctx.check("verify " + file_id);
        ChunkVerification result;
        result.chunk = chunk;
        try {
            result.present = store_.exists(chunk.chunk_id, ctx);
            if (result.present) {
                std::size_t got = read_object(chunk, ctx);
                // Capped at the recorded size plus one.
                result.actual_size = got;
                result.actual_checksum = utils::sha256_hex(buffer_.data(), got);
                if (got != chunk.chunk_size) {
                    result.error = "size mismatch";
                } else if (result.actual_checksum != chunk.checksum) {
                    result.error = "checksum mismatch";
                }
            } else {
                result.error = "missing";
            }
        } catch (const ChunkStoreError &e) {
            result.error = e.what();
        } catch (const TransferError &e) {
            if (e.get_type() == TransferError::TIMEOUT ||
                e.get_type() == TransferError::CANCELLED) {
                throw;
            }
            result.error = e.what();
        }

        if (!result.present && result.error == "missing") {
            report.missing += 1;
        } else if (!result.error.empty()) {
            report.corrupted += 1;
        }
        report.chunks.push_back(std::move(result));
    }

    ATLASFS_LOG_INFO("Verified '{}': {} chunks, {} missing, {} corrupted",
                     file_id, report.chunks.size(), report.missing,
                     report.corrupted);
    return report;
}

}  // namespace atlasfs
