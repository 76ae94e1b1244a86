#include <atlasfs/utils/time.h>

#include <cstdio>
#include <ctime>

namespace atlasfs::utils {

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      since_epoch - seconds)
                      .count();
    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm_utc.tm_year + 1900,
                  tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour,
                  tm_utc.tm_min, tm_utc.tm_sec, static_cast<int>(millis));
    return buffer;
}

std::string now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

}  // namespace atlasfs::utils
