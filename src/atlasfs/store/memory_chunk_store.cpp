#include <atlasfs/store/memory_chunk_store.h>

#include <sstream>

namespace atlasfs {

MemoryChunkStore::MemoryChunkStore(const std::string &bucket, bool create)
    : bucket_(bucket), bucket_created_(create) {}

void MemoryChunkStore::require_bucket() const {
    if (!bucket_created_) {
        throw ChunkStoreError(ChunkStoreError::UNAVAILABLE,
                              "Bucket '" + bucket_ + "' does not exist");
    }
}

void MemoryChunkStore::put(const std::string &key, const char *data,
                           std::size_t size, const OperationContext &ctx) {
    ctx.check("put " + key);
    if (key.empty()) {
        throw ChunkStoreError(ChunkStoreError::INVALID_ARGUMENT,
                              "Object key must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    require_bucket();
    objects_[key] = std::string(data, size);
}

std::unique_ptr<std::istream> MemoryChunkStore::get(
    const std::string &key, const OperationContext &ctx) {
    ctx.check("get " + key);
    std::lock_guard<std::mutex> lock(mutex_);
    require_bucket();
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        throw ChunkStoreError(ChunkStoreError::NOT_FOUND,
                              "Object '" + key + "' not found in bucket '" +
                                  bucket_ + "'");
    }
    return std::make_unique<std::istringstream>(it->second, std::ios::binary);
}

bool MemoryChunkStore::exists(const std::string &key,
                              const OperationContext &ctx) {
    ctx.check("exists " + key);
    std::lock_guard<std::mutex> lock(mutex_);
    require_bucket();
    return objects_.count(key) > 0;
}

bool MemoryChunkStore::remove(const std::string &key,
                              const OperationContext &ctx) {
    ctx.check("remove " + key);
    std::lock_guard<std::mutex> lock(mutex_);
    require_bucket();
    return objects_.erase(key) > 0;
}

bool MemoryChunkStore::bucket_exists() {
    std::lock_guard<std::mutex> lock(mutex_);
    return bucket_created_;
}

void MemoryChunkStore::create_bucket() {
    std::lock_guard<std::mutex> lock(mutex_);
    bucket_created_ = true;
}

std::size_t MemoryChunkStore::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

std::vector<std::string> MemoryChunkStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(objects_.size());
    for (const auto &entry : objects_) {
        out.push_back(entry.first);
    }
    return out;
}

void MemoryChunkStore::overwrite(const std::string &key,
                                 const std::string &bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = bytes;
}

}  // namespace atlasfs
