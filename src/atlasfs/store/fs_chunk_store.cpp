#include <atlasfs/common/logging.h>
#include <atlasfs/store/fs_chunk_store.h>
#include <atlasfs/utils/id.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace atlasfs {

namespace {
void validate_key(const std::string &key) {
    if (key.empty() || key == "." || key == ".." ||
        key.find('/') != std::string::npos ||
        key.find('\\') != std::string::npos ||
        key.find('\0') != std::string::npos) {
        throw ChunkStoreError(ChunkStoreError::INVALID_ARGUMENT,
                              "Invalid object key '" + key + "'");
    }
}

// Flushes a file or directory to stable storage.
void sync_path(const fs::path &path, bool directory) {
    int flags = O_RDONLY;
    if (directory) {
        flags |= O_DIRECTORY;
    }
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                              "Cannot open " + path.string() +
                                  " for sync: " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int sync_errno = errno;
    ::close(fd);
    if (rc != 0) {
        throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                              "fsync of " + path.string() +
                                  " failed: " + std::strerror(sync_errno));
    }
}
}  // namespace

FsChunkStore::FsChunkStore(const std::string &root, const std::string &bucket)
    : root_(root), bucket_(bucket) {
    if (root.empty()) {
        throw ChunkStoreError(ChunkStoreError::INVALID_ARGUMENT,
                              "Store root directory must not be empty");
    }
    validate_key(bucket_);
}

fs::path FsChunkStore::object_path(const std::string &key) const {
    validate_key(key);
    return root_ / bucket_ / key;
}

void FsChunkStore::require_bucket() const {
    std::error_code ec;
    if (!fs::is_directory(root_ / bucket_, ec)) {
        throw ChunkStoreError(ChunkStoreError::UNAVAILABLE,
                              "Bucket '" + bucket_ + "' does not exist under " +
                                  root_.string());
    }
}

void FsChunkStore::put(const std::string &key, const char *data,
                       std::size_t size, const OperationContext &ctx) {
    ctx.check("put " + key);
    fs::path target = object_path(key);
    require_bucket();

    fs::path partial = target;
    partial += std::string(constants::store::PARTIAL_SUFFIX) + "." +
               utils::random_hex128();

    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                                  "Cannot open " + partial.string() +
                                      " for writing");
        }
        out.write(data, static_cast<std::streamsize>(size));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(partial, ignored);
            throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                                  "Short write of " + std::to_string(size) +
                                      " bytes to " + partial.string());
        }
    }

    try {
        sync_path(partial, false);
    } catch (const ChunkStoreError &) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw;
    }

    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                              "Cannot move " + partial.string() + " to " +
                                  target.string() + ": " + ec.message());
    }
    // The rename itself is only durable once the bucket directory is synced.
    sync_path(target.parent_path(), true);
    ATLASFS_LOG_TRACE("Stored {} ({} bytes)", target.string(), size);
}

std::unique_ptr<std::istream> FsChunkStore::get(const std::string &key,
                                                const OperationContext &ctx) {
    ctx.check("get " + key);
    fs::path target = object_path(key);
    require_bucket();

    auto in = std::make_unique<std::ifstream>(target, std::ios::binary);
    if (!in->is_open()) {
        std::error_code ec;
        if (!fs::exists(target, ec)) {
            throw ChunkStoreError(ChunkStoreError::NOT_FOUND,
                                  "Object '" + key + "' not found in bucket '" +
                                      bucket_ + "'");
        }
        throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                              "Cannot open " + target.string());
    }
    return in;
}

bool FsChunkStore::exists(const std::string &key,
                          const OperationContext &ctx) {
    ctx.check("exists " + key);
    fs::path target = object_path(key);
    require_bucket();

    std::error_code ec;
    bool found = fs::is_regular_file(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                              "Cannot stat " + target.string() + ": " +
                                  ec.message());
    }
    return found;
}

bool FsChunkStore::remove(const std::string &key,
                          const OperationContext &ctx) {
    ctx.check("remove " + key);
    fs::path target = object_path(key);
    require_bucket();

    std::error_code ec;
    bool removed = fs::remove(target, ec);
    if (ec) {
        throw ChunkStoreError(ChunkStoreError::IO_ERROR,
                              "Cannot remove " + target.string() + ": " +
                                  ec.message());
    }
    return removed;
}

bool FsChunkStore::bucket_exists() {
    std::error_code ec;
    return fs::is_directory(root_ / bucket_, ec);
}

void FsChunkStore::create_bucket() {
    std::error_code ec;
    fs::create_directories(root_ / bucket_, ec);
    if (ec) {
        throw ChunkStoreError(ChunkStoreError::UNAVAILABLE,
                              "Cannot create bucket directory " +
                                  (root_ / bucket_).string() + ": " +
                                  ec.message());
    }
    ATLASFS_LOG_INFO("Created bucket {}", (root_ / bucket_).string());
}

}  // namespace atlasfs
