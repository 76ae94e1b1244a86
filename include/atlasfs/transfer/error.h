#ifndef ATLASFS_TRANSFER_ERROR_H
#define ATLASFS_TRANSFER_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace atlasfs {

class TransferError : public std::runtime_error {
   public:
    enum Type {
        INPUT_ERROR,
        NOT_FOUND,
        STORAGE_ERROR,
        INTEGRITY_ERROR,
        TIMEOUT,
        CANCELLED,
        UNAVAILABLE
    };

    TransferError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

    // Bytes already handed to the consumer when a stream aborted.
    std::uint64_t get_bytes_written() const { return bytes_written_; }
    void set_bytes_written(std::uint64_t bytes) { bytes_written_ = bytes; }

    static const char *type_name(Type type);

   private:
    Type type_;
    std::uint64_t bytes_written_ = 0;
    static std::string format_message(Type type, const std::string &message);
};

}  // namespace atlasfs

#endif  // ATLASFS_TRANSFER_ERROR_H
