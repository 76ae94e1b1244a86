#ifndef ATLASFS_SERVICE_SERVICE_H
#define ATLASFS_SERVICE_SERVICE_H

#include <atlasfs/common/context.h>
#include <atlasfs/events/event_emitter.h>
#include <atlasfs/ledger/metadata_ledger.h>
#include <atlasfs/service/config.h>
#include <atlasfs/store/chunk_store.h>
#include <atlasfs/transfer/error.h>

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace atlasfs {

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    // JSON text for every response except a successful download, whose
    // bytes go to the stream passed to Service::download.
    std::string body;
    std::uint64_t bytes_sent = 0;
    // Set when a download failed after its headers were committed.
    bool truncated = false;
    std::string error;

    // Empty string when absent. Names compare case-sensitively.
    std::string header(const std::string &name) const;
};

// 400 / 404 / 503 / 500
int http_status_for(TransferError::Type type);

/**
 * Transport independent request handlers behind the HTTP routes.
 *
 * Collaborators that cannot be built at startup are logged and left
 * missing; handlers needing them answer 503. A missing event bus only
 * costs the events.
 */
class Service {
   public:
    explicit Service(const ServiceConfig &config);
    // nullptr means unavailable. A null emitter is replaced by one that
    // rejects every event.
    Service(const ServiceConfig &config, std::shared_ptr<ChunkStore> store,
            std::shared_ptr<MetadataLedger> ledger,
            std::shared_ptr<EventEmitter> events);

    // POST /upload. A null body means the multipart file field was absent.
    HttpResponse upload(const std::string &filename, std::istream *body,
                        std::optional<std::uint64_t> declared_size =
                            std::nullopt);
    HttpResponse upload(const std::string &filename, std::istream *body,
                        std::optional<std::uint64_t> declared_size,
                        const OperationContext &ctx);

    // GET /download/{id}
    HttpResponse download(const std::string &file_id, std::ostream &body);
    HttpResponse download(const std::string &file_id, std::ostream &body,
                          const OperationContext &ctx);

    // GET /status/{id}
    HttpResponse status(const std::string &file_id);
    // GET /info/{id}
    HttpResponse info(const std::string &file_id);
    // GET /files
    HttpResponse list(std::size_t limit = constants::ledger::DEFAULT_LIST_LIMIT);
    // DELETE /files/{id}
    HttpResponse remove(const std::string &file_id);
    // GET /verify/{id}
    HttpResponse verify(const std::string &file_id);

    bool is_degraded() const { return !store_ || !ledger_; }
    const ServiceConfig &config() const { return config_; }

    // Context with the configured timeout; no deadline when it is zero.
    OperationContext make_context() const;

   private:
    ServiceConfig config_;
    std::shared_ptr<ChunkStore> store_;
    std::shared_ptr<MetadataLedger> ledger_;
    std::shared_ptr<EventEmitter> events_;

    void connect();
};

}  // namespace atlasfs

#endif  // ATLASFS_SERVICE_SERVICE_H
