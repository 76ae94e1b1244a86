#ifndef ATLASFS_UTILS_ID_H
#define ATLASFS_UTILS_ID_H

#include <string>

namespace atlasfs::utils {

// 128 random bits as 32 lowercase hex characters. Each thread owns its own
// generator seeded from std::random_device.
std::string random_hex128();

// "file_" + random_hex128()
std::string generate_file_id();

// "evt_" + random_hex128()
std::string generate_event_id();

}  // namespace atlasfs::utils

#endif  // ATLASFS_UTILS_ID_H
