#ifndef ATLASFS_UTILS_TIME_H
#define ATLASFS_UTILS_TIME_H

#include <chrono>
#include <string>

namespace atlasfs::utils {

// UTC ISO-8601 with milliseconds, e.g. 2026-10-19T12:00:00.000Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);
std::string now_iso8601();

}  // namespace atlasfs::utils

#endif  // ATLASFS_UTILS_TIME_H
