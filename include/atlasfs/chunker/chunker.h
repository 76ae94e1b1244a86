#ifndef ATLASFS_CHUNKER_CHUNKER_H
#define ATLASFS_CHUNKER_CHUNKER_H

#include <atlasfs/common/constants.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace atlasfs {

struct ChunkData {
    std::uint64_t index = 0;
    std::uint64_t offset = 0;
    std::size_t size = 0;
    std::string checksum;
    // Capacity is kept between calls to Chunker::next; only the first
    // `size` bytes belong to this chunk.
    std::vector<char> bytes;

    const char *data() const { return bytes.data(); }
};

/**
 * Splits a byte stream into sequential fixed-size chunks.
 *
 * The sequence is lazy and cannot be restarted. Only one chunk buffer is
 * held at a time; passing the same ChunkData to every next() call reuses
 * its allocation.
 */
class Chunker {
   public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE =
        constants::chunker::DEFAULT_CHUNK_SIZE;

    static constexpr std::size_t MAX_CHUNK_SIZE =
        constants::chunker::MAX_CHUNK_SIZE;

    // Throws TransferError(INPUT_ERROR) if chunk_size is zero or above
    // MAX_CHUNK_SIZE.
    explicit Chunker(std::istream &input,
                     std::size_t chunk_size = DEFAULT_CHUNK_SIZE);

    Chunker(const Chunker &) = delete;
    Chunker &operator=(const Chunker &) = delete;

    // Fills `chunk` with the next block. Returns false once the stream is
    // exhausted. Throws TransferError(INPUT_ERROR) on a read error.
    bool next(ChunkData &chunk);

    bool is_finished() const { return finished_; }
    std::size_t chunk_size() const { return chunk_size_; }
    std::uint64_t chunks_emitted() const { return chunks_emitted_; }
    std::uint64_t bytes_consumed() const { return bytes_consumed_; }

    // ceil(total_size / chunk_size)
    static std::uint64_t expected_chunk_count(std::uint64_t total_size,
                                              std::size_t chunk_size);

   private:
    std::istream &input_;
    std::size_t chunk_size_;
    std::uint64_t chunks_emitted_;
    std::uint64_t bytes_consumed_;
    bool finished_;
};

}  // namespace atlasfs

#endif  // ATLASFS_CHUNKER_CHUNKER_H
