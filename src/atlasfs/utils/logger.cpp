#include <atlasfs/common/logging.h>
#include <atlasfs/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace atlasfs::logger {

static spdlog::level::level_enum string_to_log_level_internal(
    const std::string &level_str) {
    std::string lower_level = level_str;
    std::transform(lower_level.begin(), lower_level.end(), lower_level.begin(),
                   ::tolower);

    if (lower_level == "trace") return spdlog::level::trace;
    if (lower_level == "debug") return spdlog::level::debug;
    if (lower_level == "info") return spdlog::level::info;
    if (lower_level == "warn" || lower_level == "warning")
        return spdlog::level::warn;
    if (lower_level == "err" || lower_level == "error")
        return spdlog::level::err;
    if (lower_level == "critical") return spdlog::level::critical;
    if (lower_level == "off") return spdlog::level::off;

    return spdlog::level::info;
}

int set_log_level(const std::string &level_str) {
    if (level_str.empty()) {
        return -1;
    }
    spdlog::set_level(string_to_log_level_internal(level_str));
    return 0;
}

int set_log_level_int(int level) {
    if (level < 0 || level > 6) {
        return -1;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    return 0;
}

std::string get_log_level_string() {
    switch (spdlog::get_level()) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

int get_log_level_int() { return static_cast<int>(spdlog::get_level()); }

void use_stderr_logger() {
    auto existing = spdlog::get(ATLASFS_LOGGER_NAME);
    auto logger =
        existing ? existing : spdlog::stderr_color_mt(ATLASFS_LOGGER_NAME);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v [%s:%#]");
    auto level = spdlog::get_level();
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

}  // namespace atlasfs::logger
