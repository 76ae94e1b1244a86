#ifndef ATLASFS_STORE_MEMORY_CHUNK_STORE_H
#define ATLASFS_STORE_MEMORY_CHUNK_STORE_H

#include <atlasfs/common/constants.h>
#include <atlasfs/store/chunk_store.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace atlasfs {

class MemoryChunkStore : public ChunkStore {
   public:
    explicit MemoryChunkStore(
        const std::string &bucket = constants::store::DEFAULT_BUCKET,
        bool create = true);

    void put(const std::string &key, const char *data, std::size_t size,
             const OperationContext &ctx) override;
    std::unique_ptr<std::istream> get(const std::string &key,
                                      const OperationContext &ctx) override;
    bool exists(const std::string &key, const OperationContext &ctx) override;
    bool remove(const std::string &key, const OperationContext &ctx) override;

    bool bucket_exists() override;
    void create_bucket() override;
    const std::string &bucket() const override { return bucket_; }

    std::size_t object_count() const;
    std::vector<std::string> keys() const;
    // Replaces stored bytes without going through put(); used to simulate
    // corruption.
    void overwrite(const std::string &key, const std::string &bytes);

   private:
    std::string bucket_;
    bool bucket_created_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;

    void require_bucket() const;
};

}  // namespace atlasfs

#endif  // ATLASFS_STORE_MEMORY_CHUNK_STORE_H
