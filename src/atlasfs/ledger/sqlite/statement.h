#ifndef ATLASFS_LEDGER_SQLITE_STATEMENT_H
#define ATLASFS_LEDGER_SQLITE_STATEMENT_H

#include <atlasfs/ledger/error.h>
#include <atlasfs/ledger/sqlite/database.h>
#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace atlasfs {

class SqliteStmt {
   public:
    SqliteStmt(const SqliteDatabase &db, const char *sql) {
        sqlite3 *raw_db = db.get();
        if (sqlite3_prepare_v2(raw_db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
            throw LedgerError(LedgerError::DATABASE_ERROR,
                              "Failed to prepare SQL statement: " +
                                  std::string(sqlite3_errmsg(raw_db)));
        }
    }

    ~SqliteStmt() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    SqliteStmt(const SqliteStmt &) = delete;
    SqliteStmt &operator=(const SqliteStmt &) = delete;


    void bind_text(int index, const std::string &value) {
        sqlite3_bind_text(stmt_, index, value.c_str(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void bind_int64(int index, std::uint64_t value) {
        sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    }

    int step() { return sqlite3_step(stmt_); }

    std::string column_text(int column) {
        const unsigned char *text = sqlite3_column_text(stmt_, column);
        return text ? std::string(reinterpret_cast<const char *>(text)) : "";
    }

    std::uint64_t column_uint64(int column) {
        return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, column));
    }

   private:
    sqlite3_stmt *stmt_;
};

}  // namespace atlasfs

#endif  // ATLASFS_LEDGER_SQLITE_STATEMENT_H
