#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <atlasfs/ledger/memory_ledger.h>
#include <atlasfs/ledger/sqlite_ledger.h>
#include <atlasfs/transfer/error.h>
#include <atlasfs/utils/hash.h>
#include <doctest/doctest.h>
#include <sqlite3.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "testing_utilities.h"

using namespace atlasfs;
using namespace atlasfs_test;

namespace {

struct SqliteFixture {
    TestEnvironment env;
    SqliteLedger ledger{env.path("ledger.sqlite")};
};

struct MemoryFixture {
    MemoryLedger ledger;
};

FileRecord make_file(const std::string &id,
                     const std::string &created_at = "2024-01-01T00:00:00.000Z") {
    FileRecord file;
    file.file_id = id;
    file.file_name = id + ".bin";
    file.file_size = 0;
    file.status = FileStatus::UPLOADING;
    file.user_id = "tester";
    file.created_at = created_at;
    file.updated_at = created_at;
    return file;
}

ChunkRecord make_chunk(const std::string &file_id, std::uint64_t index,
                       std::uint64_t size = 4) {
    ChunkRecord chunk;
    chunk.chunk_id = make_chunk_id(file_id, index);
    chunk.file_id = file_id;
    chunk.chunk_index = index;
    chunk.chunk_size = size;
    chunk.checksum = utils::sha256_hex(std::to_string(index));
    chunk.created_at = "2024-01-01T00:00:01.000Z";
    return chunk;
}

template <typename Fn>
LedgerError::Type error_type_of(Fn &&fn) {
    try {
        fn();
    } catch (const LedgerError &e) {
        return e.get_type();
    }
    FAIL("expected LedgerError");
    return LedgerError::DATABASE_ERROR;
}

}  // namespace

TEST_CASE_TEMPLATE("Ledger creates and looks up files", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;

    ledger.create_file(make_file("file_1"), ctx);

    FileRecord found;
    REQUIRE(ledger.lookup_file("file_1", found, ctx));
    CHECK(found.file_name == "file_1.bin");
    CHECK(found.status == FileStatus::UPLOADING);
    CHECK(found.user_id == "tester");
    CHECK(found.chunk_count == 0);

    CHECK_FALSE(ledger.lookup_file("file_unknown", found, ctx));

    CHECK(error_type_of([&] { ledger.create_file(make_file("file_1"), ctx); }) ==
          LedgerError::CONFLICT);

    FileRecord completed = make_file("file_2");
    completed.status = FileStatus::COMPLETED;
    CHECK(error_type_of([&] { ledger.create_file(completed, ctx); }) ==
          LedgerError::INVALID_ARGUMENT);
}

TEST_CASE_TEMPLATE("Ledger records chunks and lists them in order", T,
                   SqliteFixture, MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;
    ledger.create_file(make_file("file_1"), ctx);

    // Out of order arrival.
    for (std::uint64_t index : {2u, 0u, 3u, 1u}) {
        ledger.record_chunk(make_chunk("file_1", index), ctx);
    }

    auto chunks = ledger.list_chunks("file_1", ctx);
    REQUIRE(chunks.size() == 4);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].chunk_index == i);
        CHECK(chunks[i].chunk_id == make_chunk_id("file_1", i));
    }
    CHECK(ledger.list_chunks("file_unknown", ctx).empty());

    SUBCASE("recording the same chunk again is a no-op") {
        ledger.record_chunk(make_chunk("file_1", 1), ctx);
        CHECK(ledger.list_chunks("file_1", ctx).size() == 4);
    }

    SUBCASE("recording different content at an index conflicts") {
        ChunkRecord changed = make_chunk("file_1", 1);
        changed.checksum = utils::sha256_hex("other");
        CHECK(error_type_of([&] { ledger.record_chunk(changed, ctx); }) ==
              LedgerError::CONFLICT);
        auto after = ledger.list_chunks("file_1", ctx);
        CHECK(after[1].checksum == make_chunk("file_1", 1).checksum);
    }

    SUBCASE("chunk ids must match file and index") {
        ChunkRecord bad = make_chunk("file_1", 7);
        bad.chunk_id = make_chunk_id("file_1", 8);
        CHECK(error_type_of([&] { ledger.record_chunk(bad, ctx); }) ==
              LedgerError::INVALID_ARGUMENT);
    }
}

TEST_CASE_TEMPLATE("Ledger rejects chunks for unknown or finished files", T,
                   SqliteFixture, MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;

    CHECK(error_type_of([&] {
              ledger.record_chunk(make_chunk("file_missing", 0), ctx);
          }) == LedgerError::NOT_FOUND);

    ledger.create_file(make_file("file_1"), ctx);
    ledger.record_chunk(make_chunk("file_1", 0, 10), ctx);
    ledger.finalize_file("file_1", 1, 10, FileStatus::COMPLETED,
                         "2024-01-01T00:00:02.000Z", ctx);

    CHECK(error_type_of([&] {
              ledger.record_chunk(make_chunk("file_1", 1), ctx);
          }) == LedgerError::INVALID_TRANSITION);
    // Even an identical row is refused once the file left uploading.
    CHECK(error_type_of([&] {
              ledger.record_chunk(make_chunk("file_1", 0, 10), ctx);
          }) == LedgerError::INVALID_TRANSITION);
    CHECK(ledger.list_chunks("file_1", ctx).size() == 1);
}

TEST_CASE_TEMPLATE("Ledger status moves forward once", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;
    ledger.create_file(make_file("file_1"), ctx);
    ledger.record_chunk(make_chunk("file_1", 0, 4), ctx);
    ledger.record_chunk(make_chunk("file_1", 1, 2), ctx);

    SUBCASE("completion") {
        ledger.finalize_file("file_1", 2, 6, FileStatus::COMPLETED,
                             "2024-01-01T00:00:09.000Z", ctx);
        FileRecord file;
        REQUIRE(ledger.lookup_file("file_1", file, ctx));
        CHECK(file.status == FileStatus::COMPLETED);
        CHECK(file.chunk_count == 2);
        CHECK(file.file_size == 6);
        CHECK(file.updated_at == "2024-01-01T00:00:09.000Z");
        CHECK(file.created_at == "2024-01-01T00:00:00.000Z");

        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_1", 2, 6, FileStatus::FAILED,
                                       "later", ctx);
              }) == LedgerError::INVALID_TRANSITION);
        REQUIRE(ledger.lookup_file("file_1", file, ctx));
        CHECK(file.status == FileStatus::COMPLETED);
    }

    SUBCASE("failure records what was stored") {
        ledger.finalize_file("file_1", 2, 6, FileStatus::FAILED,
                             "2024-01-01T00:00:09.000Z", ctx);
        FileRecord file;
        REQUIRE(ledger.lookup_file("file_1", file, ctx));
        CHECK(file.status == FileStatus::FAILED);
        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_1", 2, 6, FileStatus::COMPLETED,
                                       "later", ctx);
              }) == LedgerError::INVALID_TRANSITION);
    }

    SUBCASE("completion must match the recorded chunks") {
        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_1", 3, 6, FileStatus::COMPLETED,
                                       "t", ctx);
              }) == LedgerError::INVALID_ARGUMENT);
        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_1", 2, 7, FileStatus::COMPLETED,
                                       "t", ctx);
              }) == LedgerError::INVALID_ARGUMENT);
        FileRecord file;
        REQUIRE(ledger.lookup_file("file_1", file, ctx));
        CHECK(file.status == FileStatus::UPLOADING);
    }

    SUBCASE("completion needs contiguous indices") {
        ledger.create_file(make_file("file_gap"), ctx);
        ledger.record_chunk(make_chunk("file_gap", 0, 4), ctx);
        ledger.record_chunk(make_chunk("file_gap", 2, 4), ctx);
        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_gap", 2, 8,
                                       FileStatus::COMPLETED, "t", ctx);
              }) == LedgerError::INVALID_ARGUMENT);
    }

    SUBCASE("uploading is not a final status") {
        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_1", 2, 6, FileStatus::UPLOADING,
                                       "t", ctx);
              }) == LedgerError::INVALID_ARGUMENT);
    }

    SUBCASE("unknown file") {
        CHECK(error_type_of([&] {
                  ledger.finalize_file("file_missing", 0, 0,
                                       FileStatus::FAILED, "t", ctx);
              }) == LedgerError::NOT_FOUND);
    }
}

TEST_CASE_TEMPLATE("Ledger completes empty files", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;
    ledger.create_file(make_file("file_empty"), ctx);
    ledger.finalize_file("file_empty", 0, 0, FileStatus::COMPLETED, "t", ctx);

    FileRecord file;
    REQUIRE(ledger.lookup_file("file_empty", file, ctx));
    CHECK(file.status == FileStatus::COMPLETED);
    CHECK(file.chunk_count == 0);
    CHECK(ledger.list_chunks("file_empty", ctx).empty());
}

TEST_CASE_TEMPLATE("Ledger lists newest files first", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;

    ledger.create_file(make_file("file_old", "2024-01-01T00:00:00.000Z"), ctx);
    ledger.create_file(make_file("file_new", "2024-03-01T00:00:00.000Z"), ctx);
    ledger.create_file(make_file("file_mid", "2024-02-01T00:00:00.000Z"), ctx);
    // Same timestamp as file_mid; inserted later so listed before it.
    ledger.create_file(make_file("file_mid2", "2024-02-01T00:00:00.000Z"),
                       ctx);

    auto files = ledger.list_files(10, ctx);
    REQUIRE(files.size() == 4);
    CHECK(files[0].file_id == "file_new");
    CHECK(files[1].file_id == "file_mid2");
    CHECK(files[2].file_id == "file_mid");
    CHECK(files[3].file_id == "file_old");

    auto limited = ledger.list_files(2, ctx);
    REQUIRE(limited.size() == 2);
    CHECK(limited[0].file_id == "file_new");
    CHECK(limited[1].file_id == "file_mid2");
}

TEST_CASE_TEMPLATE("Ledger deletes files with their chunks", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext ctx;
    ledger.create_file(make_file("file_1"), ctx);
    ledger.create_file(make_file("file_2"), ctx);
    ledger.record_chunk(make_chunk("file_1", 0), ctx);
    ledger.record_chunk(make_chunk("file_1", 1), ctx);
    ledger.record_chunk(make_chunk("file_2", 0), ctx);

    CHECK(ledger.delete_file("file_1", ctx));
    FileRecord file;
    CHECK_FALSE(ledger.lookup_file("file_1", file, ctx));
    CHECK(ledger.list_chunks("file_1", ctx).empty());
    CHECK(ledger.list_chunks("file_2", ctx).size() == 1);
    CHECK_FALSE(ledger.delete_file("file_1", ctx));

    // The id can be reused after deletion.
    ledger.create_file(make_file("file_1"), ctx);
    ledger.record_chunk(make_chunk("file_1", 0), ctx);
    CHECK(ledger.list_chunks("file_1", ctx).size() == 1);
}

TEST_CASE_TEMPLATE("Ledger refuses work on expired contexts", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;
    OperationContext expired(0);
    try {
        ledger.create_file(make_file("file_1"), expired);
        FAIL("expected TransferError");
    } catch (const TransferError &e) {
        CHECK(e.get_type() == TransferError::TIMEOUT);
    }
    FileRecord file;
    CHECK_FALSE(ledger.lookup_file("file_1", file, OperationContext()));
}

TEST_CASE_TEMPLATE("Ledger handles concurrent uploads", T, SqliteFixture,
                   MemoryFixture) {
    T fixture;
    MetadataLedger &ledger = fixture.ledger;

    const int file_count = 6;
    const std::uint64_t chunks_per_file = 20;
    std::vector<std::thread> threads;
    for (int f = 0; f < file_count; ++f) {
        threads.emplace_back([&ledger, f, chunks_per_file] {
            OperationContext ctx;
            std::string id = "file_" + std::to_string(f);
            ledger.create_file(make_file(id), ctx);
            for (std::uint64_t i = 0; i < chunks_per_file; ++i) {
                ledger.record_chunk(make_chunk(id, i, 3), ctx);
            }
            ledger.finalize_file(id, chunks_per_file, chunks_per_file * 3,
                                 FileStatus::COMPLETED, "t", ctx);
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    OperationContext ctx;
    CHECK(ledger.list_files(100, ctx).size() ==
          static_cast<std::size_t>(file_count));
    for (int f = 0; f < file_count; ++f) {
        FileRecord file;
        REQUIRE(ledger.lookup_file("file_" + std::to_string(f), file, ctx));
        CHECK(file.status == FileStatus::COMPLETED);
        CHECK(ledger.list_chunks(file.file_id, ctx).size() == chunks_per_file);
    }
}

TEST_CASE("SqliteLedger persists across reopen") {
    TestEnvironment env;
    std::string db_path = env.path("ledger.sqlite");
    OperationContext ctx;
    {
        SqliteLedger ledger(db_path);
        CHECK(ledger.get_db_path() == db_path);
        ledger.create_file(make_file("file_1"), ctx);
        ledger.record_chunk(make_chunk("file_1", 0, 5), ctx);
        ledger.finalize_file("file_1", 1, 5, FileStatus::COMPLETED, "t", ctx);
    }
    SqliteLedger reopened(db_path);
    FileRecord file;
    REQUIRE(reopened.lookup_file("file_1", file, ctx));
    CHECK(file.status == FileStatus::COMPLETED);
    CHECK(reopened.list_chunks("file_1", ctx).size() == 1);
}

TEST_CASE("SqliteLedger reports unknown stored status values") {
    TestEnvironment env;
    std::string db_path = env.path("ledger.sqlite");
    SqliteLedger ledger(db_path);
    OperationContext ctx;
    ledger.create_file(make_file("file_1"), ctx);

    sqlite3 *raw = nullptr;
    REQUIRE(sqlite3_open(db_path.c_str(), &raw) == SQLITE_OK);
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> guard(raw,
                                                             &sqlite3_close);
    REQUIRE(sqlite3_exec(raw,
                         "UPDATE files SET status = 'archived' "
                         "WHERE file_id = 'file_1';",
                         nullptr, nullptr, nullptr) == SQLITE_OK);

    FileRecord file;
    CHECK(error_type_of([&] { ledger.lookup_file("file_1", file, ctx); }) ==
          LedgerError::DATABASE_ERROR);
}

TEST_CASE("SqliteLedger reports an unopenable database") {
    TestEnvironment env;
    std::string db_path = env.path("no/such/dir/ledger.sqlite");
    CHECK(error_type_of([&] { SqliteLedger ledger(db_path); }) ==
          LedgerError::UNAVAILABLE);
}

TEST_CASE("Status strings round trip through parse_status") {
    CHECK(std::string(to_string(FileStatus::UPLOADING)) == "uploading");
    CHECK(std::string(to_string(FileStatus::COMPLETED)) == "completed");
    CHECK(std::string(to_string(FileStatus::FAILED)) == "failed");
    CHECK(parse_status("completed") == FileStatus::COMPLETED);
    CHECK_THROWS_AS(parse_status("Completed"), LedgerError);
    CHECK(make_chunk_id("file_ab", 3) == "file_ab_chunk_3");
}
