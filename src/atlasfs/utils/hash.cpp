#include <atlasfs/utils/hash.h>
#include <picosha2.h>

namespace atlasfs::utils {

std::string sha256_hex(const char *data, std::size_t size) {
    picosha2::hash256_one_by_one hasher;
    hasher.init();
    hasher.process(data, data + size);
    hasher.finish();
    std::string hex;
    picosha2::get_hash_hex_string(hasher, hex);
    return hex;
}

std::string sha256_hex(const std::string &data) {
    return sha256_hex(data.data(), data.size());
}

}  // namespace atlasfs::utils
