#ifndef ATLASFS_LEDGER_ERROR_H
#define ATLASFS_LEDGER_ERROR_H

#include <stdexcept>
#include <string>

namespace atlasfs {

class LedgerError : public std::runtime_error {
   public:
    enum Type {
        NOT_FOUND,
        DATABASE_ERROR,
        INVALID_ARGUMENT,
        INVALID_TRANSITION,
        CONFLICT,
        UNAVAILABLE
    };

    LedgerError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    Type type_;
    static std::string format_message(Type type, const std::string &message);
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_ERROR_H
