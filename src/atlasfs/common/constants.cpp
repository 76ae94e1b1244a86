#include <atlasfs/common/constants.h>

namespace atlasfs::constants {

namespace ledger {
const char *SQL_SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS files (
      file_id TEXT PRIMARY KEY,
      file_name TEXT NOT NULL,
      file_size INTEGER NOT NULL,
      chunk_count INTEGER NOT NULL DEFAULT 0,
      status TEXT NOT NULL DEFAULT 'uploading',
      user_id TEXT,
      created_at TEXT NOT NULL,
      updated_at TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS chunks (
      chunk_id TEXT PRIMARY KEY,
      file_id TEXT NOT NULL REFERENCES files(file_id) ON DELETE CASCADE,
      chunk_index INTEGER NOT NULL,
      chunk_size INTEGER NOT NULL,
      checksum TEXT NOT NULL,
      created_at TEXT NOT NULL,
      UNIQUE(file_id, chunk_index)
    );

    CREATE INDEX IF NOT EXISTS idx_files_status ON files(status);
    CREATE INDEX IF NOT EXISTS idx_files_user ON files(user_id);
    CREATE INDEX IF NOT EXISTS idx_files_created_at ON files(created_at DESC);
    CREATE INDEX IF NOT EXISTS idx_chunks_file ON chunks(file_id, chunk_index);
  )";
}  // namespace ledger

}  // namespace atlasfs::constants
