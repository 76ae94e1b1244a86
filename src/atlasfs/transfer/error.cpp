#include <atlasfs/transfer/error.h>

namespace atlasfs {

const char *TransferError::type_name(Type type) {
    switch (type) {
        case INPUT_ERROR:
            return "INPUT";
        case NOT_FOUND:
            return "NOT_FOUND";
        case STORAGE_ERROR:
            return "STORAGE";
        case INTEGRITY_ERROR:
            return "INTEGRITY";
        case TIMEOUT:
            return "TIMEOUT";
        case CANCELLED:
            return "CANCELLED";
        case UNAVAILABLE:
            return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

std::string TransferError::format_message(Type type,
                                          const std::string &message) {
    return "[" + std::string(type_name(type)) + "] " + message;
}

}  // namespace atlasfs
