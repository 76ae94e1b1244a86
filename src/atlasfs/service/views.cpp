#include <atlasfs/service/views.h>

namespace atlasfs::views {

nlohmann::json file_json(const FileRecord &file) {
    return nlohmann::json{{"id", file.file_id},
                          {"name", file.file_name},
                          {"size", file.file_size},
                          {"chunk_count", file.chunk_count},
                          {"status", to_string(file.status)},
                          {"user_id", file.user_id},
                          {"created_at", file.created_at},
                          {"updated_at", file.updated_at}};
}

nlohmann::json file_info_json(const FileRecord &file) {
    return nlohmann::json{{"file_id", file.file_id},
                          {"file_name", file.file_name},
                          {"file_size", file.file_size},
                          {"chunk_count", file.chunk_count},
                          {"status", to_string(file.status)},
                          {"created_at", file.created_at},
                          {"download_url", "/download/" + file.file_id}};
}

nlohmann::json chunk_json(const ChunkRecord &chunk) {
    return nlohmann::json{{"id", chunk.chunk_id},
                          {"file_id", chunk.file_id},
                          {"index", chunk.chunk_index},
                          {"size", chunk.chunk_size},
                          {"checksum", chunk.checksum},
                          {"created_at", chunk.created_at}};
}

nlohmann::json upload_json(const UploadResult &result) {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &chunk : result.chunks) {
        chunks.push_back(chunk_json(chunk));
    }
    return nlohmann::json{{"file_id", result.file.file_id},
                          {"filename", result.file.file_name},
                          {"size", result.file.file_size},
                          {"chunk_count", result.file.chunk_count},
                          {"status", to_string(result.file.status)},
                          {"chunks", chunks}};
}

nlohmann::json verification_json(const VerificationReport &report) {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &entry : report.chunks) {
        nlohmann::json item{{"id", entry.chunk.chunk_id},
                            {"index", entry.chunk.chunk_index},
                            {"size", entry.chunk.chunk_size},
                            {"ok", entry.ok()}};
        if (!entry.error.empty()) {
            item["error"] = entry.error;
        }
        chunks.push_back(item);
    }
    nlohmann::json body{{"file_id", report.file.file_id},
                        {"status", to_string(report.file.status)},
                        {"ok", report.ok()},
                        {"missing", report.missing},
                        {"corrupted", report.corrupted},
                        {"chunks", chunks}};
    if (!report.structure_error.empty()) {
        body["structure_error"] = report.structure_error;
    }
    return body;
}

std::string error_body(const std::string &message) {
    return nlohmann::json{{"error", message}}.dump();
}

std::string content_disposition(const std::string &file_name) {
    std::string quoted;
    quoted.reserve(file_name.size() + 2);
    for (char c : file_name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) {
            continue;
        }
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    return "attachment; filename=\"" + quoted + "\"";
}

}  // namespace atlasfs::views
