#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <atlasfs/chunker/chunker.h>
#include <atlasfs/transfer/error.h>
#include <atlasfs/utils/hash.h>
#include <doctest/doctest.h>

#include <sstream>
#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace atlasfs;
using namespace atlasfs_test;

namespace {
std::vector<ChunkData> collect(std::istream &in, std::size_t chunk_size) {
    Chunker chunker(in, chunk_size);
    std::vector<ChunkData> chunks;
    ChunkData chunk;
    while (chunker.next(chunk)) {
        ChunkData copy = chunk;
        copy.bytes.resize(chunk.size);
        chunks.push_back(std::move(copy));
    }
    return chunks;
}
}  // namespace

TEST_CASE("SHA-256 helpers produce lowercase hex digests") {
    CHECK(utils::sha256_hex("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(utils::sha256_hex("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(utils::sha256_hex(std::string("abc")) ==
          utils::sha256_hex("abc", 3));
}

TEST_CASE("10 MiB with 4 MiB chunks gives 4, 4 and 2 MiB") {
    std::string input = make_random_bytes(mb_to_b(10));
    std::istringstream in(input);

    auto chunks = collect(in, mb_to_b(4));
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].size == mb_to_b(4));
    CHECK(chunks[1].size == mb_to_b(4));
    CHECK(chunks[2].size == mb_to_b(2));

    std::string joined;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].index == i);
        CHECK(chunks[i].offset == i * mb_to_b(4));
        CHECK(chunks[i].checksum ==
              utils::sha256_hex(chunks[i].data(), chunks[i].size));
        joined.append(chunks[i].data(), chunks[i].size);
    }
    CHECK(joined == input);
}

TEST_CASE("Empty input yields no chunks") {
    std::istringstream in("");
    Chunker chunker(in, 16);
    ChunkData chunk;
    CHECK_FALSE(chunker.next(chunk));
    CHECK(chunker.is_finished());
    CHECK(chunker.chunks_emitted() == 0);
    CHECK(chunker.bytes_consumed() == 0);
    CHECK_FALSE(chunker.next(chunk));
}

TEST_CASE("Exact multiples do not produce a trailing empty chunk") {
    std::istringstream in("abcdefgh");
    auto chunks = collect(in, 4);
    REQUIRE(chunks.size() == 2);
    CHECK(std::string(chunks[0].data(), chunks[0].size) == "abcd");
    CHECK(std::string(chunks[1].data(), chunks[1].size) == "efgh");
}

TEST_CASE("Chunk count is the ceiling of size over chunk size") {
    const std::size_t chunk_sizes[] = {1, 3, 7, 64};
    for (std::size_t chunk_size : chunk_sizes) {
        for (std::size_t size = 0; size <= 200; size += 13) {
            std::istringstream in(make_random_bytes(size, 7));
            Chunker chunker(in, chunk_size);
            ChunkData chunk;
            std::uint64_t produced = 0;
            std::uint64_t last_size = 0;
            while (chunker.next(chunk)) {
                ++produced;
                last_size = chunk.size;
                CHECK(chunk.size <= chunk_size);
            }
            CHECK(produced == (size + chunk_size - 1) / chunk_size);
            CHECK(produced == Chunker::expected_chunk_count(size, chunk_size));
            CHECK(chunker.bytes_consumed() == size);
            if (produced > 0) {
                CHECK(last_size == size - (produced - 1) * chunk_size);
            }
        }
    }
}

TEST_CASE("Chunk size zero is rejected") {
    std::istringstream in("data");
    try {
        Chunker chunker(in, 0);
        FAIL("expected TransferError");
    } catch (const TransferError &e) {
        CHECK(e.get_type() == TransferError::INPUT_ERROR);
    }
    CHECK_THROWS_AS(Chunker::expected_chunk_count(10, 0), TransferError);
}

TEST_CASE("Chunk sizes above the maximum are rejected") {
    std::istringstream in("data");
    const std::size_t too_large[] = {Chunker::MAX_CHUNK_SIZE + 1,
                                     std::size_t(1) << 50};
    for (std::size_t chunk_size : too_large) {
        CAPTURE(chunk_size);
        try {
            Chunker chunker(in, chunk_size);
            FAIL("expected TransferError");
        } catch (const TransferError &e) {
            CHECK(e.get_type() == TransferError::INPUT_ERROR);
        }
    }
    Chunker largest(in, Chunker::MAX_CHUNK_SIZE);
    CHECK(largest.chunk_size() == Chunker::MAX_CHUNK_SIZE);
}

TEST_CASE("A read error on the source raises INPUT_ERROR") {
    FailingStreambuf buf(make_random_bytes(10));
    std::istream in(&buf);
    Chunker chunker(in, 4);
    ChunkData chunk;

    REQUIRE(chunker.next(chunk));
    REQUIRE(chunker.next(chunk));
    try {
        chunker.next(chunk);
        FAIL("expected TransferError");
    } catch (const TransferError &e) {
        CHECK(e.get_type() == TransferError::INPUT_ERROR);
    }
    CHECK(chunker.is_finished());
}

TEST_CASE("The chunk buffer is reused between calls") {
    std::string input = make_random_bytes(4096);
    std::istringstream in(input);
    Chunker chunker(in, 1024);
    ChunkData chunk;
    REQUIRE(chunker.next(chunk));
    const char *first = chunk.data();
    REQUIRE(chunker.next(chunk));
    CHECK(chunk.data() == first);
    CHECK(std::string(chunk.data(), chunk.size) == input.substr(1024, 1024));
}
