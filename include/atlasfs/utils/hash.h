#ifndef ATLASFS_UTILS_HASH_H
#define ATLASFS_UTILS_HASH_H

#include <cstddef>
#include <string>

namespace atlasfs::utils {

// Lowercase hex SHA-256 of [data, data + size).
std::string sha256_hex(const char *data, std::size_t size);
std::string sha256_hex(const std::string &data);

}  // namespace atlasfs::utils

#endif  // ATLASFS_UTILS_HASH_H
