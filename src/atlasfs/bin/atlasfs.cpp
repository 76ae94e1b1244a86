#include <atlasfs/common/logging.h>
#include <atlasfs/config.h>
#include <atlasfs/events/file_event_emitter.h>
#include <atlasfs/service/config.h>
#include <atlasfs/service/service.h>
#include <atlasfs/utils/logger.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace atlasfs;

static int print_response(const HttpResponse &response) {
    if (!response.body.empty()) {
        nlohmann::json body = nlohmann::json::parse(response.body, nullptr,
                                                    false);
        if (body.is_discarded()) {
            std::cout << response.body << std::endl;
        } else {
            std::cout << body.dump(2) << std::endl;
        }
    }
    return response.status >= 400 ? 1 : 0;
}

static int run_upload(Service &service, const std::string &path,
                      const std::string &name_override) {
    std::string name = name_override;
    if (path == "-") {
        if (name.empty()) name = "stdin";
        return print_response(service.upload(name, &std::cin));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        spdlog::error("Cannot open {}", path);
        return 1;
    }
    if (name.empty()) {
        name = fs::path(path).filename().string();
    }
    std::optional<std::uint64_t> declared;
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto size = fs::file_size(path, ec);
        if (!ec) declared = static_cast<std::uint64_t>(size);
    }
    return print_response(service.upload(name, &input, declared));
}

static int run_download(Service &service, const std::string &file_id,
                        const std::string &output) {
    if (output == "-") {
        HttpResponse response = service.download(file_id, std::cout);
        std::cout.flush();
        if (response.status != 200) {
            if (!response.body.empty()) {
                std::cerr << response.body << std::endl;
            } else {
                spdlog::error("Download failed after {} bytes: {}",
                              response.bytes_sent, response.error);
            }
            return 1;
        }
        return 0;
    }

    fs::path target(output);
    fs::path partial = target;
    partial += ".download";
    HttpResponse response;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Cannot open {} for writing", partial.string());
            return 1;
        }
        response = service.download(file_id, out);
    }

    std::error_code ec;
    if (response.status != 200) {
        fs::remove(partial, ec);
        if (!response.body.empty()) {
            std::cerr << response.body << std::endl;
        } else {
            spdlog::error("Download failed after {} of {} bytes: {}",
                          response.bytes_sent,
                          response.header("Content-Length"), response.error);
        }
        return 1;
    }
    fs::rename(partial, target, ec);
    if (ec) {
        spdlog::error("Cannot move {} to {}: {}", partial.string(),
                      target.string(), ec.message());
        return 1;
    }
    spdlog::info("Wrote {} bytes to {}", response.bytes_sent, target.string());
    return 0;
}

static int run_events(const ServiceConfig &config, const std::string &file_id,
                      const std::string &type) {
    FileEventEmitter topic(config.events_dir());
    for (const auto &message : topic.read_all()) {
        if (!file_id.empty() && message.file_id != file_id) continue;
        if (!type.empty() && message.type != type) continue;
        std::cout << message.payload << "\n";
    }
    std::cout.flush();
    return 0;
}

int main(int argc, char **argv) {
    argparse::ArgumentParser program("atlasfs", ATLASFS_PACKAGE_VERSION);
    program.add_description(
        "Chunked file storage: split files into checksummed chunks, store "
        "them and stream them back");
    program.add_argument("--config")
        .help("JSON configuration file")
        .default_value<std::string>("");
    program.add_argument("-d", "--data-dir")
        .help("Directory holding the object store, ledger and events")
        .default_value<std::string>("");
    program.add_argument("-b", "--bucket")
        .help("Object store bucket name")
        .default_value<std::string>("");
    program.add_argument("-c", "--chunk-size")
        .help("Chunk size in megabytes (default: 4)")
        .scan<'g', double>()
        .default_value<double>(0.0);
    program.add_argument("--timeout-ms")
        .help("Per-operation timeout in milliseconds, 0 disables it")
        .scan<'d', int64_t>()
        .default_value<int64_t>(-1);
    program.add_argument("--user")
        .help("User id recorded with uploads")
        .default_value<std::string>("");
    program.add_argument("--log-level")
        .help(
            "Set logging level (trace, debug, info, warn, error, critical, "
            "off)")
        .default_value<std::string>("");

    argparse::ArgumentParser upload_cmd("upload");
    upload_cmd.add_description("Upload a file");
    upload_cmd.add_argument("file").help("File to upload, '-' for stdin");
    upload_cmd.add_argument("-n", "--name")
        .help("Stored file name (default: the file's base name)")
        .default_value<std::string>("");

    argparse::ArgumentParser download_cmd("download");
    download_cmd.add_description("Download a completed file");
    download_cmd.add_argument("file_id").help("File id returned by upload");
    download_cmd.add_argument("-o", "--output")
        .help("Output path, '-' for stdout")
        .default_value<std::string>("-");

    argparse::ArgumentParser status_cmd("status");
    status_cmd.add_description("Show the stored record of a file");
    status_cmd.add_argument("file_id");

    argparse::ArgumentParser info_cmd("info");
    info_cmd.add_description("Show download information for a file");
    info_cmd.add_argument("file_id");

    argparse::ArgumentParser list_cmd("list");
    list_cmd.add_description("List files, newest first");
    list_cmd.add_argument("-l", "--limit")
        .help("Maximum number of files")
        .default_value<size_t>(constants::ledger::DEFAULT_LIST_LIMIT)
        .scan<'d', size_t>();

    argparse::ArgumentParser delete_cmd("delete");
    delete_cmd.add_description("Delete a file and its chunks");
    delete_cmd.add_argument("file_id");

    argparse::ArgumentParser verify_cmd("verify");
    verify_cmd.add_description("Re-hash every stored chunk of a file");
    verify_cmd.add_argument("file_id");

    argparse::ArgumentParser events_cmd("events");
    events_cmd.add_description("Print lifecycle events from the topic file");
    events_cmd.add_argument("--file-id")
        .help("Only events of this file")
        .default_value<std::string>("");
    events_cmd.add_argument("--type")
        .help("Only events of this type, e.g. file.upload.completed")
        .default_value<std::string>("");

    program.add_subparser(upload_cmd);
    program.add_subparser(download_cmd);
    program.add_subparser(status_cmd);
    program.add_subparser(info_cmd);
    program.add_subparser(list_cmd);
    program.add_subparser(delete_cmd);
    program.add_subparser(verify_cmd);
    program.add_subparser(events_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception &err) {
        spdlog::error("Error occurred: {}", err.what());
        std::cerr << program;
        return 1;
    }

    // stderr-based logger so logs never mix with file bytes on stdout
    logger::use_stderr_logger();

    ServiceConfig config;
    try {
        std::string config_path = program.get<std::string>("--config");
        if (!config_path.empty()) {
            config = ServiceConfig::from_file(config_path);
        }
        config.apply_env();

        std::string data_dir = program.get<std::string>("--data-dir");
        std::string bucket = program.get<std::string>("--bucket");
        double chunk_size_mb = program.get<double>("--chunk-size");
        int64_t timeout_ms = program.get<int64_t>("--timeout-ms");
        std::string user = program.get<std::string>("--user");
        std::string log_level = program.get<std::string>("--log-level");

        if (!data_dir.empty()) config.set_data_dir(data_dir);
        if (!bucket.empty()) config.set_bucket(bucket);
        if (chunk_size_mb < 0) {
            throw std::invalid_argument("chunk size must not be negative");
        }
        if (chunk_size_mb > 0) {
            config.set_chunk_size(
                static_cast<std::size_t>(chunk_size_mb * 1024 * 1024));
        }
        if (timeout_ms >= 0) {
            config.set_timeout_ms(static_cast<std::uint64_t>(timeout_ms));
        }
        if (!user.empty()) config.set_user_id(user);
        if (!log_level.empty()) config.set_log_level(log_level);
        config.validate();
    } catch (const std::invalid_argument &e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    logger::set_log_level(config.log_level());
    spdlog::debug("Log level set to: {}", config.log_level());

    if (program.is_subcommand_used(events_cmd)) {
        try {
            return run_events(config, events_cmd.get<std::string>("--file-id"),
                              events_cmd.get<std::string>("--type"));
        } catch (const std::runtime_error &e) {
            spdlog::error("Cannot read events: {}", e.what());
            return 1;
        }
    }

    Service service(config);

    if (program.is_subcommand_used(upload_cmd)) {
        return run_upload(service, upload_cmd.get<std::string>("file"),
                          upload_cmd.get<std::string>("--name"));
    }
    if (program.is_subcommand_used(download_cmd)) {
        return run_download(service, download_cmd.get<std::string>("file_id"),
                            download_cmd.get<std::string>("--output"));
    }
    if (program.is_subcommand_used(status_cmd)) {
        return print_response(
            service.status(status_cmd.get<std::string>("file_id")));
    }
    if (program.is_subcommand_used(info_cmd)) {
        return print_response(
            service.info(info_cmd.get<std::string>("file_id")));
    }
    if (program.is_subcommand_used(list_cmd)) {
        return print_response(service.list(list_cmd.get<size_t>("--limit")));
    }
    if (program.is_subcommand_used(delete_cmd)) {
        return print_response(
            service.remove(delete_cmd.get<std::string>("file_id")));
    }
    if (program.is_subcommand_used(verify_cmd)) {
        HttpResponse response =
            service.verify(verify_cmd.get<std::string>("file_id"));
        int rc = print_response(response);
        if (rc == 0) {
            nlohmann::json body = nlohmann::json::parse(response.body);
            return body.value("ok", false) ? 0 : 2;
        }
        return rc;
    }

    std::cerr << program;
    return 1;
}
