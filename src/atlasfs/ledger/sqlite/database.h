#ifndef ATLASFS_LEDGER_SQLITE_DATABASE_H
#define ATLASFS_LEDGER_SQLITE_DATABASE_H

#include <atlasfs/ledger/error.h>
#include <sqlite3.h>

#include <string>

namespace atlasfs {

class SqliteDatabase {
   public:
    SqliteDatabase() : db_(nullptr) {}
    explicit SqliteDatabase(const std::string &path) : db_(nullptr) {
        open(path);
    }
    ~SqliteDatabase() { close(); }

    SqliteDatabase(const SqliteDatabase &) = delete;
    SqliteDatabase &operator=(const SqliteDatabase &) = delete;

    void open(const std::string &path) {
        close();
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            std::string error =
                db_ ? std::string(sqlite3_errmsg(db_)) : "out of memory";
            close();
            throw LedgerError(LedgerError::UNAVAILABLE,
                              "Cannot open database " + path + ": " + error);
        }
    }

    void close() {
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    sqlite3 *get() const { return db_; }

    void exec(const char *sql) const {
        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? std::string(errmsg) : last_error();
            sqlite3_free(errmsg);
            throw LedgerError(LedgerError::DATABASE_ERROR,
                              "Statement failed: " + error);
        }
    }

    int changes() const { return sqlite3_changes(db_); }

    std::string last_error() const {
        return db_ ? std::string(sqlite3_errmsg(db_)) : "database not open";
    }

   private:
    sqlite3 *db_;
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_SQLITE_DATABASE_H
