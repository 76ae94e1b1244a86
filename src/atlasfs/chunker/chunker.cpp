#include <atlasfs/chunker/chunker.h>
#include <atlasfs/common/logging.h>
#include <atlasfs/transfer/error.h>
#include <atlasfs/utils/hash.h>

#include <string>

namespace atlasfs {

Chunker::Chunker(std::istream &input, std::size_t chunk_size)
    : input_(input),
      chunk_size_(chunk_size),
      chunks_emitted_(0),
      bytes_consumed_(0),
      finished_(false) {
    if (chunk_size_ == 0) {
        throw TransferError(TransferError::INPUT_ERROR,
                            "Chunk size must be greater than zero");
    }
    if (chunk_size_ > MAX_CHUNK_SIZE) {
        throw TransferError(TransferError::INPUT_ERROR,
                            "Chunk size " + std::to_string(chunk_size_) +
                                " exceeds the maximum of " +
                                std::to_string(MAX_CHUNK_SIZE) + " bytes");
    }
}

bool Chunker::next(ChunkData &chunk) {
    if (finished_) {
        return false;
    }

    if (chunk.bytes.size() < chunk_size_) {
        chunk.bytes.resize(chunk_size_);
    }

    // A short read is only final at end of stream; keep reading until the
    // block is full so every chunk but the last has exactly chunk_size_ bytes.
    std::size_t filled = 0;
    while (filled < chunk_size_) {
        input_.read(chunk.bytes.data() + filled,
                    static_cast<std::streamsize>(chunk_size_ - filled));
        std::streamsize got = input_.gcount();
        if (input_.bad()) {
            finished_ = true;
            throw TransferError(TransferError::INPUT_ERROR,
                                "Read error on source stream after " +
                                    std::to_string(bytes_consumed_ + filled) +
                                    " bytes");
        }
        filled += static_cast<std::size_t>(got);
        if (input_.eof()) {
            break;
        }
        if (got == 0 && input_.fail()) {
            finished_ = true;
            throw TransferError(TransferError::INPUT_ERROR,
                                "Source stream failed after " +
                                    std::to_string(bytes_consumed_ + filled) +
                                    " bytes");
        }
    }

    if (filled == 0) {
        finished_ = true;
        return false;
    }
    if (filled < chunk_size_) {
        finished_ = true;
    }

    chunk.index = chunks_emitted_;
    chunk.offset = bytes_consumed_;
    chunk.size = filled;
    chunk.checksum = utils::sha256_hex(chunk.bytes.data(), filled);

    ++chunks_emitted_;
    bytes_consumed_ += filled;

    ATLASFS_LOG_TRACE("Chunk {} at offset {}: {} bytes, sha256 {}", chunk.index,
                      chunk.offset, chunk.size, chunk.checksum);
    return true;
}

std::uint64_t Chunker::expected_chunk_count(std::uint64_t total_size,
                                            std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw TransferError(TransferError::INPUT_ERROR,
                            "Chunk size must be greater than zero");
    }
    return (total_size + chunk_size - 1) / chunk_size;
}

}  // namespace atlasfs
