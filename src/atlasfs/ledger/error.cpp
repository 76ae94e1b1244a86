#include <atlasfs/ledger/error.h>

namespace atlasfs {

std::string LedgerError::format_message(Type type, const std::string &message) {
    std::string prefix;
    switch (type) {
        case NOT_FOUND:
            prefix = "[NOT_FOUND]";
            break;
        case DATABASE_ERROR:
            prefix = "[DATABASE]";
            break;
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case INVALID_TRANSITION:
            prefix = "[INVALID_TRANSITION]";
            break;
        case CONFLICT:
            prefix = "[CONFLICT]";
            break;
        case UNAVAILABLE:
            prefix = "[UNAVAILABLE]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace atlasfs
