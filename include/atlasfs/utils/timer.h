#ifndef ATLASFS_UTILS_TIMER_H
#define ATLASFS_UTILS_TIMER_H

#include <chrono>
#include <string>

namespace atlasfs::utils {

class Timer {
   public:
    Timer(bool autostart = false, bool verbose = false);
    Timer(const std::string &name, bool autostart = false,
          bool verbose = false);
    ~Timer();
    void start();
    void stop();
    double elapsed() const;

   private:
    bool verbose_ = false;
    bool running_ = false;
    std::string name_;
    using Clock = std::chrono::steady_clock;
    Clock::time_point start_time_;
    Clock::time_point end_time_;
};

}  // namespace atlasfs::utils

#endif  // ATLASFS_UTILS_TIMER_H
