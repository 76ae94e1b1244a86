#ifndef ATLASFS_LEDGER_SQLITE_TRANSACTION_H
#define ATLASFS_LEDGER_SQLITE_TRANSACTION_H

#include <atlasfs/ledger/sqlite/database.h>

namespace atlasfs {

// BEGIN IMMEDIATE on construction; rolls back on destruction unless
// commit() was called.
class SqliteTransaction {
   public:
    explicit SqliteTransaction(const SqliteDatabase &db)
        : db_(db), active_(false) {
        db_.exec("BEGIN IMMEDIATE;");
        active_ = true;
    }

    ~SqliteTransaction() {
        if (active_) {
            sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    SqliteTransaction(const SqliteTransaction &) = delete;
    SqliteTransaction &operator=(const SqliteTransaction &) = delete;

    void commit() {
        db_.exec("COMMIT;");
        active_ = false;
    }

   private:
    const SqliteDatabase &db_;
    bool active_;
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_SQLITE_TRANSACTION_H
