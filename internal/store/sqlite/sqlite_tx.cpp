#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace feedstore::store::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) return;

  try {
    db_.Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    FEEDSTORE_LOG_WARN("SQLite rollback failed", {observability::StringField("path", db_.Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

} // namespace feedstore::store::sqlite
