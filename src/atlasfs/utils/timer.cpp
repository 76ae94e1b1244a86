#include <atlasfs/common/logging.h>
#include <atlasfs/utils/timer.h>

namespace atlasfs::utils {

Timer::Timer(bool autostart, bool verbose)
    : verbose_(verbose), running_(false) {
    if (autostart) {
        start();
    }
}

Timer::Timer(const std::string &name, bool autostart, bool verbose)
    : verbose_(verbose), running_(false), name_(name) {
    if (autostart) {
        start();
    }
}

Timer::~Timer() {
    stop();
    if (verbose_) {
        if (name_.empty()) {
            ATLASFS_LOG_DEBUG("Elapsed time: {:.3f} ms", elapsed());
        } else {
            ATLASFS_LOG_DEBUG("[{}] Elapsed time: {:.3f} ms", name_,
                              elapsed());
        }
    }
}

void Timer::start() {
    start_time_ = Clock::now();
    running_ = true;
}

void Timer::stop() {
    if (running_) {
        end_time_ = Clock::now();
        running_ = false;
    }
}

// Milliseconds since start(), up to stop() if stopped.
double Timer::elapsed() const {
    if (running_) {
        return std::chrono::duration<double, std::milli>(Clock::now() -
                                                         start_time_)
            .count();
    }
    return std::chrono::duration<double, std::milli>(end_time_ - start_time_)
        .count();
}

}  // namespace atlasfs::utils
