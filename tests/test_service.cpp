#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <atlasfs/events/file_event_emitter.h>
#include <atlasfs/events/memory_event_emitter.h>
#include <atlasfs/ledger/memory_ledger.h>
#include <atlasfs/service/service.h>
#include <atlasfs/store/memory_chunk_store.h>
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <memory>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>

#include "testing_utilities.h"

using namespace atlasfs;
using namespace atlasfs_test;
using nlohmann::json;

namespace {

ServiceConfig small_chunks(const std::string &data_dir) {
    return ServiceConfig(data_dir).set_chunk_size(10).set_user_id("bob");
}

std::string upload_ok(Service &service, const std::string &name,
                      const std::string &bytes) {
    std::istringstream in(bytes);
    HttpResponse response = service.upload(name, &in, bytes.size());
    REQUIRE(response.status == 200);
    return json::parse(response.body)["file_id"].get<std::string>();
}

// In-memory collaborators shared with the test body.
struct MemoryBackend {
    std::shared_ptr<MemoryChunkStore> store =
        std::make_shared<MemoryChunkStore>();
    std::shared_ptr<MemoryLedger> ledger = std::make_shared<MemoryLedger>();
    std::shared_ptr<MemoryEventEmitter> events =
        std::make_shared<MemoryEventEmitter>();
};

// Reads fail with exceptions outside the ledger's own error type.
class BrokenReadsLedger : public MemoryLedger {
   public:
    bool lookup_file(const std::string &, FileRecord &,
                     const OperationContext &) override {
        throw std::runtime_error("ledger index corrupted");
    }
    std::vector<FileRecord> list_files(std::size_t,
                                       const OperationContext &) override {
        throw std::bad_alloc();
    }
};

}  // namespace

TEST_CASE("Service uploads and downloads through the data directory") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    ServiceConfig config = small_chunks(env.path("data"));
    Service service(config);
    CHECK_FALSE(service.is_degraded());

    std::string content = make_random_bytes(25);
    std::istringstream in(content);
    HttpResponse uploaded = service.upload("notes.txt", &in, content.size());
    REQUIRE(uploaded.status == 200);
    CHECK(uploaded.header("Content-Type") == "application/json");

    json body = json::parse(uploaded.body);
    std::string id = body["file_id"].get<std::string>();
    CHECK(body["filename"] == "notes.txt");
    CHECK(body["size"] == 25);
    CHECK(body["chunk_count"] == 3);
    CHECK(body["status"] == "completed");
    REQUIRE(body["chunks"].size() == 3);
    CHECK(body["chunks"][2]["index"] == 2);
    CHECK(body["chunks"][2]["size"] == 5);
    CHECK(body["chunks"][0]["id"] == id + "_chunk_0");

    std::ostringstream out;
    HttpResponse downloaded = service.download(id, out);
    CHECK(downloaded.status == 200);
    CHECK(out.str() == content);
    CHECK(downloaded.bytes_sent == 25);
    CHECK_FALSE(downloaded.truncated);
    CHECK(downloaded.header("Content-Length") == "25");
    CHECK(downloaded.header("Content-Type") == "application/octet-stream");
    CHECK(downloaded.header("Content-Disposition") ==
          "attachment; filename=\"notes.txt\"");

    SUBCASE("status") {
        HttpResponse response = service.status(id);
        CHECK(response.status == 200);
        json status = json::parse(response.body);
        CHECK(status["id"] == id);
        CHECK(status["name"] == "notes.txt");
        CHECK(status["size"] == 25);
        CHECK(status["chunk_count"] == 3);
        CHECK(status["status"] == "completed");
        CHECK(status["user_id"] == "bob");
        CHECK(status.contains("created_at"));
        CHECK(status.contains("updated_at"));
    }

    SUBCASE("info") {
        json info = json::parse(service.info(id).body);
        CHECK(info["file_id"] == id);
        CHECK(info["file_name"] == "notes.txt");
        CHECK(info["file_size"] == 25);
        CHECK(info["download_url"] == "/download/" + id);
    }

    SUBCASE("events reach the topic file in order") {
        FileEventEmitter topic(config.events_dir());
        auto messages = topic.read_all();
        REQUIRE(messages.size() == 6);
        CHECK(messages[0].type == "file.upload.started");
        CHECK(messages[1].type == "file.chunk.created");
        CHECK(messages[1].key == id + "_chunk_0");
        CHECK(messages[3].key == id + "_chunk_2");
        CHECK(messages[4].type == "file.upload.completed");
        CHECK(messages[4].key == id);
        CHECK(messages[5].type == "file.download.completed");
        for (const auto &message : messages) {
            CHECK(message.file_id == id);
        }
    }

    SUBCASE("verify") {
        HttpResponse response = service.verify(id);
        CHECK(response.status == 200);
        json report = json::parse(response.body);
        CHECK(report["ok"] == true);
        CHECK(report["chunks"].size() == 3);
    }

    SUBCASE("state survives a restart") {
        Service restarted(config);
        std::ostringstream again;
        CHECK(restarted.download(id, again).status == 200);
        CHECK(again.str() == content);
    }

    SUBCASE("remove") {
        HttpResponse removed = service.remove(id);
        CHECK(removed.status == 200);
        CHECK(json::parse(removed.body)["objects_removed"] == 3);
        CHECK(service.status(id).status == 404);
        std::ostringstream gone;
        CHECK(service.download(id, gone).status == 404);
        CHECK(service.remove(id).status == 404);
    }
}

TEST_CASE("Service maps request errors to statuses") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    backend.events);

    SUBCASE("missing file field") {
        HttpResponse response = service.upload("a.txt", nullptr);
        CHECK(response.status == 400);
        CHECK(json::parse(response.body)["error"] == "No file provided");
    }

    SUBCASE("empty file name") {
        std::istringstream in("abc");
        CHECK(service.upload("", &in).status == 400);
    }

    SUBCASE("body shorter than declared") {
        std::istringstream in("abc");
        CHECK(service.upload("a.txt", &in, 10).status == 400);
        auto files = backend.ledger->list_files(10, OperationContext());
        REQUIRE(files.size() == 1);
        CHECK(files[0].status == FileStatus::FAILED);
    }

    SUBCASE("unknown ids") {
        std::ostringstream out;
        HttpResponse response = service.download("file_nope", out);
        CHECK(response.status == 404);
        CHECK(out.str().empty());
        CHECK(response.header("Content-Length").empty());
        CHECK(service.status("file_nope").status == 404);
        CHECK(service.info("file_nope").status == 404);
        CHECK(service.verify("file_nope").status == 404);
        CHECK(json::parse(service.status("file_nope").body)["error"] ==
              "File not found");
        CHECK(backend.store->object_count() == 0);
    }
}

TEST_CASE("Service handles zero byte files") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    backend.events);
    std::string id = upload_ok(service, "empty.bin", "");

    json status = json::parse(service.status(id).body);
    CHECK(status["size"] == 0);
    CHECK(status["chunk_count"] == 0);
    CHECK(status["status"] == "completed");

    std::ostringstream out;
    HttpResponse response = service.download(id, out);
    CHECK(response.status == 200);
    CHECK(response.header("Content-Length") == "0");
    CHECK(out.str().empty());
}

TEST_CASE("Service reports a truncated download after headers") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    backend.events);
    std::string content = make_random_bytes(30);
    std::string id = upload_ok(service, "big.bin", content);

    backend.store->overwrite(id + "_chunk_1", "corrupted!");

    std::ostringstream out;
    HttpResponse response = service.download(id, out);
    CHECK(response.status == 500);
    CHECK(response.truncated);
    CHECK(response.header("Content-Length") == "30");
    CHECK(response.bytes_sent == 10);
    CHECK(response.bytes_sent < 30);
    CHECK(out.str() == content.substr(0, 10));
    CHECK_FALSE(response.error.empty());
    CHECK(backend.events->events_of(EventType::DOWNLOAD_COMPLETED).empty());
}

TEST_CASE("Service answers 500 and marks the file failed on store errors") {
    MemoryBackend backend;
    auto faulty = std::make_shared<FaultyChunkStore>(*backend.store);
    faulty->fail_puts_after = 1;
    Service service(small_chunks("unused"), faulty, backend.ledger,
                    backend.events);

    std::string content = make_random_bytes(30);
    std::istringstream in(content);
    HttpResponse response = service.upload("x.bin", &in, content.size());
    CHECK(response.status == 500);

    auto files = backend.ledger->list_files(10, OperationContext());
    REQUIRE(files.size() == 1);
    json status = json::parse(service.status(files[0].file_id).body);
    CHECK(status["status"] == "failed");
    CHECK(status["chunk_count"] == 1);
    CHECK(backend.events->events_of(EventType::UPLOAD_FAILED).size() == 1);
}

TEST_CASE("Service answers 500 for unexpected exceptions") {
    MemoryBackend backend;

    SUBCASE("upload") {
        auto faulty = std::make_shared<FaultyChunkStore>(*backend.store);
        faulty->on_put = [](std::size_t) { throw std::bad_alloc(); };
        Service service(small_chunks("unused"), faulty, backend.ledger,
                        backend.events);

        std::string content = make_random_bytes(30);
        std::istringstream in(content);
        HttpResponse response = service.upload("x.bin", &in, content.size());
        CHECK(response.status == 500);
        CHECK(response.header("Content-Type") == "application/json");
        CHECK(json::parse(response.body)["error"] == "Internal error");

        auto files = backend.ledger->list_files(10, OperationContext());
        REQUIRE(files.size() == 1);
        CHECK(files[0].status == FileStatus::FAILED);
    }

    SUBCASE("reads") {
        auto broken = std::make_shared<BrokenReadsLedger>();
        Service service(small_chunks("unused"), backend.store, broken,
                        backend.events);

        std::ostringstream out;
        HttpResponse downloaded = service.download("file_x", out);
        CHECK(downloaded.status == 500);
        CHECK_FALSE(downloaded.truncated);
        CHECK(out.str().empty());
        CHECK(json::parse(downloaded.body)["error"] == "Internal error");

        CHECK(service.status("file_x").status == 500);
        CHECK(service.info("file_x").status == 500);
        CHECK(service.list().status == 500);
        CHECK(service.remove("file_x").status == 500);
        CHECK(service.verify("file_x").status == 500);
    }
}

TEST_CASE("Service quotes the download file name") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    backend.events);

    std::string id = upload_ok(service, "a\"b;c\r\nSet-Cookie: x=1\\.txt",
                               "payload");
    std::ostringstream out;
    HttpResponse response = service.download(id, out);
    REQUIRE(response.status == 200);
    std::string disposition = response.header("Content-Disposition");
    CHECK(disposition ==
          "attachment; filename=\"a\\\"b;cSet-Cookie: x=1\\\\.txt\"");
    CHECK(disposition.find('\r') == std::string::npos);
    CHECK(disposition.find('\n') == std::string::npos);
    CHECK(out.str() == "payload");
}

TEST_CASE("Service keeps serving without an event bus") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    nullptr);
    std::string id = upload_ok(service, "quiet.bin", "some bytes here");
    std::ostringstream out;
    CHECK(service.download(id, out).status == 200);
    CHECK(out.str() == "some bytes here");
}

TEST_CASE("Service without collaborators answers 503") {
    TestEnvironment env;
    std::string blocker = env.path("blocker");
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }
    Service service(ServiceConfig(blocker + "/data"));
    CHECK(service.is_degraded());

    std::istringstream in("abc");
    CHECK(service.upload("a.txt", &in).status == 503);
    std::ostringstream out;
    CHECK(service.download("file_x", out).status == 503);
    CHECK(service.status("file_x").status == 503);
    CHECK(service.list().status == 503);

    MemoryBackend backend;
    Service no_store(ServiceConfig("unused"), nullptr, backend.ledger, nullptr);
    CHECK(no_store.is_degraded());
    std::istringstream in2("abc");
    CHECK(no_store.upload("a.txt", &in2).status == 503);
    // Metadata reads work without the object store.
    CHECK(no_store.list().status == 200);
}

TEST_CASE("Service lists files newest first") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    backend.events);
    for (int i = 0; i < 3; ++i) {
        upload_ok(service, "f" + std::to_string(i) + ".txt", "payload");
    }

    json all = json::parse(service.list().body);
    CHECK(all["count"] == 3);
    REQUIRE(all["files"].size() == 3);
    CHECK(all["files"][0]["name"] == "f2.txt");
    CHECK(all["files"][2]["name"] == "f0.txt");

    json limited = json::parse(service.list(1).body);
    CHECK(limited["count"] == 1);
}

TEST_CASE("Service verify flags damaged chunks") {
    MemoryBackend backend;
    Service service(small_chunks("unused"), backend.store, backend.ledger,
                    backend.events);
    std::string id = upload_ok(service, "v.bin", make_random_bytes(20));
    backend.store->overwrite(id + "_chunk_0", "tampered!!");

    json report = json::parse(service.verify(id).body);
    CHECK(report["ok"] == false);
    CHECK(report["corrupted"] == 1);
    CHECK(report["chunks"][0]["error"] == "checksum mismatch");
    CHECK(report["chunks"][1]["ok"] == true);
}

TEST_CASE("Service applies the configured timeout") {
    MemoryBackend backend;
    Service unlimited(ServiceConfig("unused").set_timeout_ms(0),
                      backend.store, backend.ledger, backend.events);
    CHECK_FALSE(unlimited.make_context().has_deadline());

    Service limited(ServiceConfig("unused").set_timeout_ms(5000),
                    backend.store, backend.ledger, backend.events);
    OperationContext ctx = limited.make_context();
    CHECK(ctx.has_deadline());
    CHECK(ctx.remaining_ms(0) <= 5000);

    std::istringstream in("abc");
    HttpResponse response =
        limited.upload("late.txt", &in, std::nullopt, OperationContext(0));
    CHECK(response.status == 500);
}

TEST_CASE("HTTP statuses for transfer errors") {
    CHECK(http_status_for(TransferError::INPUT_ERROR) == 400);
    CHECK(http_status_for(TransferError::NOT_FOUND) == 404);
    CHECK(http_status_for(TransferError::UNAVAILABLE) == 503);
    CHECK(http_status_for(TransferError::STORAGE_ERROR) == 500);
    CHECK(http_status_for(TransferError::INTEGRITY_ERROR) == 500);
    CHECK(http_status_for(TransferError::TIMEOUT) == 500);
    CHECK(http_status_for(TransferError::CANCELLED) == 500);
}

TEST_CASE("ServiceConfig defaults, files and environment") {
    ServiceConfig defaults;
    CHECK(defaults.data_dir() == "atlasfs-data");
    CHECK(defaults.bucket() == "atlasfs-chunks");
    CHECK(defaults.chunk_size() == 4 * 1024 * 1024);
    CHECK(defaults.metadata_retries() == 3);
    CHECK(defaults.db_path() == "atlasfs-data/atlasfs.sqlite");
    CHECK(defaults.events_dir() == "atlasfs-data/events");
    CHECK_NOTHROW(defaults.validate());

    SUBCASE("file overlay") {
        TestEnvironment env;
        std::string path = env.path("config.json");
        {
            std::ofstream out(path);
            out << R"({"data_dir": "/srv/atlas", "chunk_size": 1024,
                       "timeout_ms": 0, "log_level": "debug"})";
        }
        ServiceConfig config = ServiceConfig::from_file(path);
        CHECK(config.data_dir() == "/srv/atlas");
        CHECK(config.db_path() == "/srv/atlas/atlasfs.sqlite");
        CHECK(config.chunk_size() == 1024);
        CHECK(config.timeout_ms() == 0);
        CHECK(config.log_level() == "debug");
        CHECK(config.bucket() == "atlasfs-chunks");

        CHECK_THROWS_AS(ServiceConfig::from_file(env.path("missing.json")),
                        std::invalid_argument);
    }

    SUBCASE("environment overlay") {
        setenv("ATLASFS_BUCKET", "env-bucket", 1);
        setenv("ATLASFS_METADATA_RETRIES", "7", 1);
        ServiceConfig config = ServiceConfig::from_env();
        unsetenv("ATLASFS_BUCKET");
        unsetenv("ATLASFS_METADATA_RETRIES");
        CHECK(config.bucket() == "env-bucket");
        CHECK(config.metadata_retries() == 7);

        setenv("ATLASFS_CHUNK_SIZE", "lots", 1);
        CHECK_THROWS_AS(ServiceConfig::from_env(), std::invalid_argument);
        unsetenv("ATLASFS_CHUNK_SIZE");
    }

    SUBCASE("validation") {
        CHECK_THROWS_AS(ServiceConfig().set_chunk_size(0).validate(),
                        std::invalid_argument);
        CHECK_THROWS_AS(ServiceConfig().set_bucket("../up").validate(),
                        std::invalid_argument);
        CHECK_THROWS_AS(ServiceConfig().set_log_level("loud").validate(),
                        std::invalid_argument);
        CHECK_THROWS_AS(Service(ServiceConfig().set_chunk_size(0)),
                        std::invalid_argument);
        CHECK_THROWS_AS(ServiceConfig()
                            .set_chunk_size(constants::chunker::MAX_CHUNK_SIZE + 1)
                            .validate(),
                        std::invalid_argument);
        CHECK_THROWS_AS(ServiceConfig()
                            .set_chunk_size(std::size_t(1) << 50)
                            .validate(),
                        std::invalid_argument);
        CHECK_NOTHROW(ServiceConfig()
                          .set_chunk_size(constants::chunker::MAX_CHUNK_SIZE)
                          .validate());
    }
}
