#ifndef ATLASFS_TRANSFER_HELPERS_H
#define ATLASFS_TRANSFER_HELPERS_H

#include <atlasfs/ledger/error.h>
#include <atlasfs/store/error.h>
#include <atlasfs/transfer/error.h>

#include <string>

namespace atlasfs {

// Collaborator failures surface to callers of the orchestrators as
// TransferError(STORAGE_ERROR) with the original message kept.
inline TransferError storage_failure(const std::string &what,
                                     const std::exception &cause) {
    return TransferError(TransferError::STORAGE_ERROR,
                         what + ": " + cause.what());
}

inline bool is_retryable(const LedgerError &e) {
    return e.get_type() == LedgerError::DATABASE_ERROR ||
           e.get_type() == LedgerError::UNAVAILABLE;
}

}  // namespace atlasfs

#endif  // ATLASFS_TRANSFER_HELPERS_H
