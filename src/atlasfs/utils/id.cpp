#include <atlasfs/utils/id.h>

#include <cstdint>
#include <cstdio>
#include <random>

namespace atlasfs::utils {

namespace {
std::mt19937_64 &thread_generator() {
    thread_local std::mt19937_64 generator([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());
    return generator;
}
}  // namespace

std::string random_hex128() {
    auto &gen = thread_generator();
    std::uint64_t hi = gen();
    std::uint64_t lo = gen();
    char buffer[33];
    std::snprintf(buffer, sizeof(buffer), "%016llx%016llx",
                  static_cast<unsigned long long>(hi),
                  static_cast<unsigned long long>(lo));
    return std::string(buffer, 32);
}

std::string generate_file_id() { return "file_" + random_hex128(); }

std::string generate_event_id() { return "evt_" + random_hex128(); }

}  // namespace atlasfs::utils
