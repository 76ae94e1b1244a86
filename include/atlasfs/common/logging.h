#ifndef ATLASFS_COMMON_LOGGING_H
#define ATLASFS_COMMON_LOGGING_H

#include <spdlog/spdlog.h>

// Logging macros forward to the default spdlog logger with the call site
// attached, so a sink pattern containing %s:%# prints file and line.
// Format strings use fmt syntax ("{}").

#define ATLASFS_LOGGER_NAME "ATLASFS"

#define ATLASFS_INTERNAL_LOG(level, ...)                                    \
    spdlog::default_logger_raw()->log(                                      \
        spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, level,     \
        __VA_ARGS__)

#if defined(ATLASFS_LOGGER_DISABLED) && (ATLASFS_LOGGER_DISABLED == 1)
#define ATLASFS_LOG_TRACE(...)
#define ATLASFS_LOG_DEBUG(...)
#define ATLASFS_LOG_INFO(...)
#define ATLASFS_LOG_WARN(...)
#define ATLASFS_LOG_ERROR(...)
#else
#define ATLASFS_LOG_TRACE(...) \
    ATLASFS_INTERNAL_LOG(spdlog::level::trace, __VA_ARGS__)
#define ATLASFS_LOG_DEBUG(...) \
    ATLASFS_INTERNAL_LOG(spdlog::level::debug, __VA_ARGS__)
#define ATLASFS_LOG_INFO(...) \
    ATLASFS_INTERNAL_LOG(spdlog::level::info, __VA_ARGS__)
#define ATLASFS_LOG_WARN(...) \
    ATLASFS_INTERNAL_LOG(spdlog::level::warn, __VA_ARGS__)
#define ATLASFS_LOG_ERROR(...) \
    ATLASFS_INTERNAL_LOG(spdlog::level::err, __VA_ARGS__)
#endif

#endif  // ATLASFS_COMMON_LOGGING_H
