#ifndef ATLASFS_SERVICE_VIEWS_H
#define ATLASFS_SERVICE_VIEWS_H

#include <atlasfs/ledger/records.h>
#include <atlasfs/transfer/reassembler.h>
#include <atlasfs/transfer/upload.h>

#include <nlohmann/json.hpp>
#include <string>

namespace atlasfs::views {

// {id, name, size, chunk_count, status, user_id, created_at, updated_at}
nlohmann::json file_json(const FileRecord &file);

// status fields plus download_url
nlohmann::json file_info_json(const FileRecord &file);

// {id, file_id, index, size, checksum, created_at}
nlohmann::json chunk_json(const ChunkRecord &chunk);

nlohmann::json upload_json(const UploadResult &result);

nlohmann::json verification_json(const VerificationReport &report);

std::string error_body(const std::string &message);

// `attachment; filename="..."` with control characters dropped and quotes
// and backslashes escaped.
std::string content_disposition(const std::string &file_name);

}  // namespace atlasfs::views

#endif  // ATLASFS_SERVICE_VIEWS_H
