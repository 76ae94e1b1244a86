#include <atlasfs/common/logging.h>
#include <atlasfs/events/file_event_emitter.h>
#include <atlasfs/events/memory_event_emitter.h>
#include <atlasfs/ledger/sqlite_ledger.h>
#include <atlasfs/service/service.h>
#include <atlasfs/service/views.h>
#include <atlasfs/store/fs_chunk_store.h>
#include <atlasfs/transfer/deleter.h>
#include <atlasfs/transfer/download.h>
#include <atlasfs/transfer/reassembler.h>
#include <atlasfs/transfer/upload.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace atlasfs {

namespace {

HttpResponse json_response(int status, const nlohmann::json &body) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = body.dump();
    return response;
}

HttpResponse error_response(int status, const std::string &message) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = views::error_body(message);
    response.error = message;
    return response;
}

HttpResponse transfer_error_response(const TransferError &e) {
    int status = http_status_for(e.get_type());
    if (status >= 500) {
        ATLASFS_LOG_ERROR("Request failed: {}", e.what());
    } else {
        ATLASFS_LOG_DEBUG("Request rejected: {}", e.what());
    }
    return error_response(status, e.what());
}

HttpResponse internal_error_response(const std::string &what,
                                     const std::exception &e) {
    ATLASFS_LOG_ERROR("{} failed: {}", what, e.what());
    return error_response(500, "Internal error");
}

HttpResponse unavailable(const std::string &what) {
    return error_response(503, what + " not available");
}

}  // namespace

std::string HttpResponse::header(const std::string &name) const {
    for (const auto &entry : headers) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    return "";
}

int http_status_for(TransferError::Type type) {
    switch (type) {
        case TransferError::INPUT_ERROR:
            return 400;
        case TransferError::NOT_FOUND:
            return 404;
        case TransferError::UNAVAILABLE:
            return 503;
        default:
            return 500;
    }
}

Service::Service(const ServiceConfig &config) : config_(config) {
    config_.validate();
    connect();
}

Service::Service(const ServiceConfig &config, std::shared_ptr<ChunkStore> store,
                 std::shared_ptr<MetadataLedger> ledger,
                 std::shared_ptr<EventEmitter> events)
    : config_(config),
      store_(std::move(store)),
      ledger_(std::move(ledger)),
      events_(std::move(events)) {
    config_.validate();
    if (!events_) {
        events_ = std::make_shared<NullEventEmitter>();
    }
}

void Service::connect() {
    std::error_code ec;
    fs::create_directories(config_.data_dir(), ec);
    if (ec) {
        ATLASFS_LOG_WARN("Cannot create data directory {}: {}",
                         config_.data_dir(), ec.message());
    }

    try {
        auto store =
            std::make_shared<FsChunkStore>(config_.data_dir(), config_.bucket());
        if (!store->bucket_exists()) {
            store->create_bucket();
        }
        store_ = store;
    } catch (const ChunkStoreError &e) {
        ATLASFS_LOG_WARN("Object store unavailable: {}", e.what());
    }

    try {
        int busy_timeout = SqliteLedger::DEFAULT_BUSY_TIMEOUT_MS;
        if (config_.timeout_ms() > 0) {
            busy_timeout = static_cast<int>(
                std::min<std::uint64_t>(config_.timeout_ms(), busy_timeout));
        }
        ledger_ = std::make_shared<SqliteLedger>(config_.db_path(), busy_timeout);
    } catch (const LedgerError &e) {
        ATLASFS_LOG_WARN("Metadata ledger unavailable: {}", e.what());
    }

    try {
        events_ = std::make_shared<FileEventEmitter>(config_.events_dir());
    } catch (const std::runtime_error &e) {
        ATLASFS_LOG_WARN("Event bus unavailable, events will be dropped: {}",
                         e.what());
        events_ = std::make_shared<NullEventEmitter>();
    }

    if (is_degraded()) {
        ATLASFS_LOG_WARN("Service started in degraded mode");
    } else {
        ATLASFS_LOG_DEBUG("Service ready: data dir {}, bucket {}",
                          config_.data_dir(), config_.bucket());
    }
}

OperationContext Service::make_context() const {
    if (config_.timeout_ms() == 0) {
        return OperationContext();
    }
    return OperationContext(config_.timeout_ms());
}

HttpResponse Service::upload(const std::string &filename, std::istream *body,
                             std::optional<std::uint64_t> declared_size) {
    return upload(filename, body, declared_size, make_context());
}

HttpResponse Service::upload(const std::string &filename, std::istream *body,
                             std::optional<std::uint64_t> declared_size,
                             const OperationContext &ctx) {
    if (!body) {
        return error_response(400, "No file provided");
    }
    if (filename.empty()) {
        return error_response(400, "File name must not be empty");
    }
    if (!ledger_) return unavailable("Database");
    if (!store_) return unavailable("Object store");

    UploadOptions options;
    options.chunk_size = config_.chunk_size();
    options.metadata_retries = config_.metadata_retries();
    options.user_id = config_.user_id();

    UploadOrchestrator uploader(*store_, *ledger_, *events_, options);
    try {
        UploadResult result = uploader.upload(filename, *body, ctx,
                                              declared_size);
        return json_response(200, views::upload_json(result));
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Upload of " + filename, e);
    }
}

HttpResponse Service::download(const std::string &file_id,
                               std::ostream &body) {
    return download(file_id, body, make_context());
}

HttpResponse Service::download(const std::string &file_id, std::ostream &body,
                               const OperationContext &ctx) {
    if (!ledger_) return unavailable("Database");
    if (!store_) return unavailable("Object store");

    DownloadOrchestrator downloader(*ledger_, *store_, *events_);
    ReassemblyPlan plan;
    try {
        plan = downloader.prepare(file_id, ctx);
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Download of " + file_id, e);
    }

    // Headers are committed from here on.
    HttpResponse response;
    response.status = 200;
    response.headers.emplace_back(
        "Content-Disposition", views::content_disposition(plan.file.file_name));
    response.headers.emplace_back("Content-Type", "application/octet-stream");
    response.headers.emplace_back("Content-Length",
                                  std::to_string(plan.file.file_size));

    try {
        DownloadResult result = downloader.send(plan, body, ctx);
        response.bytes_sent = result.bytes_sent;
    } catch (const TransferError &e) {
        response.status = 500;
        response.truncated = true;
        response.bytes_sent = e.get_bytes_written();
        response.error = e.what();
        ATLASFS_LOG_ERROR("Download of {} truncated at {} of {} bytes: {}",
                          file_id, response.bytes_sent, plan.file.file_size,
                          e.what());
    } catch (const std::exception &e) {
        response.status = 500;
        response.truncated = true;
        response.error = e.what();
        ATLASFS_LOG_ERROR("Download of {} aborted: {}", file_id, e.what());
    }
    return response;
}

HttpResponse Service::status(const std::string &file_id) {
    if (!ledger_) return unavailable("Database");
    try {
        FileRecord file;
        if (!ledger_->lookup_file(file_id, file, make_context())) {
            return error_response(404, "File not found");
        }
        return json_response(200, views::file_json(file));
    } catch (const LedgerError &e) {
        ATLASFS_LOG_ERROR("Status lookup of {} failed: {}", file_id, e.what());
        return error_response(500, "Database error");
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Status lookup of " + file_id, e);
    }
}

HttpResponse Service::info(const std::string &file_id) {
    if (!ledger_) return unavailable("Database");
    try {
        FileRecord file;
        if (!ledger_->lookup_file(file_id, file, make_context())) {
            return error_response(404, "File not found");
        }
        return json_response(200, views::file_info_json(file));
    } catch (const LedgerError &e) {
        ATLASFS_LOG_ERROR("Info lookup of {} failed: {}", file_id, e.what());
        return error_response(500, "Database error");
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Info lookup of " + file_id, e);
    }
}

HttpResponse Service::list(std::size_t limit) {
    if (!ledger_) return unavailable("Database");
    try {
        nlohmann::json files = nlohmann::json::array();
        for (const auto &file : ledger_->list_files(limit, make_context())) {
            files.push_back(views::file_json(file));
        }
        std::size_t count = files.size();
        return json_response(200, {{"files", files}, {"count", count}});
    } catch (const LedgerError &e) {
        ATLASFS_LOG_ERROR("Listing files failed: {}", e.what());
        return error_response(500, "Database error");
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Listing files", e);
    }
}

HttpResponse Service::remove(const std::string &file_id) {
    if (!ledger_) return unavailable("Database");
    if (!store_) return unavailable("Object store");

    FileDeleter deleter(*ledger_, *store_, *events_);
    try {
        DeleteResult result = deleter.remove(file_id, make_context());
        return json_response(200, {{"file_id", file_id},
                                   {"deleted", true},
                                   {"objects_removed", result.objects_removed},
                                   {"objects_missing",
                                    result.objects_missing}});
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Delete of " + file_id, e);
    }
}

HttpResponse Service::verify(const std::string &file_id) {
    if (!ledger_) return unavailable("Database");
    if (!store_) return unavailable("Object store");

    Reassembler reassembler(*ledger_, *store_);
    try {
        VerificationReport report = reassembler.verify(file_id, make_context());
        return json_response(200, views::verification_json(report));
    } catch (const TransferError &e) {
        return transfer_error_response(e);
    } catch (const std::exception &e) {
        return internal_error_response("Verify of " + file_id, e);
    }
}

}  // namespace atlasfs
