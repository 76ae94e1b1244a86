#include <atlasfs/store/error.h>

namespace atlasfs {

std::string ChunkStoreError::format_message(Type type,
                                            const std::string &message) {
    std::string prefix;
    switch (type) {
        case NOT_FOUND:
            prefix = "[NOT_FOUND]";
            break;
        case IO_ERROR:
            prefix = "[IO]";
            break;
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case UNAVAILABLE:
            prefix = "[UNAVAILABLE]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace atlasfs
