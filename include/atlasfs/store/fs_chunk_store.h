#ifndef ATLASFS_STORE_FS_CHUNK_STORE_H
#define ATLASFS_STORE_FS_CHUNK_STORE_H

#include <atlasfs/common/constants.h>
#include <atlasfs/store/chunk_store.h>

#include <filesystem>
#include <string>

namespace atlasfs {

/**
 * Directory backed object store: <root>/<bucket>/<key>, one file per key.
 * Writes go to a uniquely named partial file first, are fsynced, and are
 * renamed into place; the bucket directory is fsynced after the rename.
 */
class FsChunkStore : public ChunkStore {
   public:
    FsChunkStore(const std::string &root,
                 const std::string &bucket = constants::store::DEFAULT_BUCKET);

    void put(const std::string &key, const char *data, std::size_t size,
             const OperationContext &ctx) override;
    std::unique_ptr<std::istream> get(const std::string &key,
                                      const OperationContext &ctx) override;
    bool exists(const std::string &key, const OperationContext &ctx) override;
    bool remove(const std::string &key, const OperationContext &ctx) override;

    bool bucket_exists() override;
    void create_bucket() override;
    const std::string &bucket() const override { return bucket_; }

    std::filesystem::path bucket_path() const { return root_ / bucket_; }

   private:
    std::filesystem::path root_;
    std::string bucket_;

    std::filesystem::path object_path(const std::string &key) const;
    void require_bucket() const;
};

}  // namespace atlasfs

#endif  // ATLASFS_STORE_FS_CHUNK_STORE_H
