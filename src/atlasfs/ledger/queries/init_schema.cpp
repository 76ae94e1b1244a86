#include <atlasfs/common/constants.h>
#include <atlasfs/common/logging.h>
#include <atlasfs/ledger/queries/queries.h>

namespace atlasfs {

void throw_step_error(const SqliteDatabase &db, int rc,
                      const std::string &what) {
    int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        throw LedgerError(LedgerError::UNAVAILABLE,
                          what + ": database is busy (" + db.last_error() +
                              ")");
    }
    throw LedgerError(LedgerError::DATABASE_ERROR,
                      what + ": " + db.last_error());
}

void init_schema(const SqliteDatabase &db) {
    db.exec("PRAGMA journal_mode=WAL;");
    db.exec("PRAGMA synchronous=NORMAL;");
    db.exec("PRAGMA foreign_keys=ON;");
    db.exec(constants::ledger::SQL_SCHEMA);
    ATLASFS_LOG_DEBUG("Schema init succeeded");
}

}  // namespace atlasfs
