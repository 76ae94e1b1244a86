#ifndef ATLASFS_UTILS_LOGGER_H
#define ATLASFS_UTILS_LOGGER_H

#include <string>

namespace atlasfs::logger {
/**
 * Set the global spdlog log level
 * @param level_str "trace", "debug", "info", "warn"/"warning",
 *                  "err"/"error", "critical" or "off" (case insensitive).
 *                  Unrecognized values fall back to info.
 * @return 0 on success, -1 if level_str is empty
 */
int set_log_level(const std::string &level_str);

/**
 * Set the global spdlog log level using integer level
 * @param level 0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
 * @return 0 on success, -1 if level is out of range
 */
int set_log_level_int(int level);

std::string get_log_level_string();

int get_log_level_int();

/**
 * Replace the default logger with a stderr color logger named after the
 * project, so log output never mixes with file bytes written to stdout.
 */
void use_stderr_logger();
}  // namespace atlasfs::logger

#endif  // ATLASFS_UTILS_LOGGER_H
