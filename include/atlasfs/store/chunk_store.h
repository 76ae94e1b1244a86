#ifndef ATLASFS_STORE_CHUNK_STORE_H
#define ATLASFS_STORE_CHUNK_STORE_H

#include <atlasfs/common/context.h>
#include <atlasfs/store/error.h>

#include <cstddef>
#include <istream>
#include <memory>
#include <string>

namespace atlasfs {

/**
 * Key to bytes object storage inside a single bucket.
 *
 * Implementations must be safe for concurrent use. Failures are reported as
 * ChunkStoreError; an expired or cancelled context raises TransferError.
 */
class ChunkStore {
   public:
    virtual ~ChunkStore() = default;

    // Stores `size` bytes under `key`, replacing any previous object
    // atomically. Repeating a put with the same bytes is harmless.
    virtual void put(const std::string &key, const char *data,
                     std::size_t size, const OperationContext &ctx) = 0;

    // Opens the object for reading. Throws ChunkStoreError(NOT_FOUND) when
    // the key is absent.
    virtual std::unique_ptr<std::istream> get(const std::string &key,
                                              const OperationContext &ctx) = 0;

    virtual bool exists(const std::string &key,
                        const OperationContext &ctx) = 0;

    // Returns false when there was nothing to remove.
    virtual bool remove(const std::string &key,
                        const OperationContext &ctx) = 0;

    virtual bool bucket_exists() = 0;
    virtual void create_bucket() = 0;
    virtual const std::string &bucket() const = 0;
};

}  // namespace atlasfs

#endif  // ATLASFS_STORE_CHUNK_STORE_H
