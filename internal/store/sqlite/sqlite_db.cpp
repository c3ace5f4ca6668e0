#include "sqlite_db.hpp"

namespace feedstore::store::sqlite {

namespace {

int OpenFlags(OpenMode mode) {
  switch (mode) {
    case OpenMode::kReadOnly:
      return SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
    case OpenMode::kReadWrite:
      return SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    case OpenMode::kCreate:
      return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  }
  return SQLITE_OPEN_READONLY;
}

} // namespace

SqliteDB::SqliteDB(std::string path, OpenMode mode, uint32_t busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, OpenFlags(mode), nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, path_ + ": " + msg);
  }

  try {
    Configure(mode, busy_timeout_ms);
  } catch (const SqliteError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Check(int rc, const char* what) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return;
  throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db_));
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc, msg);
  }
}

StatementPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  StatementPtr  owned(stmt, &sqlite3_finalize);
  Check(rc, "sqlite prepare");
  return owned;
}

bool SqliteDB::TableExists(const std::string& table) {
  auto st = Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  sqlite3_bind_text(st.get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(st.get());
  Check(rc, "sqlite schema lookup");
  return rc == SQLITE_ROW;
}

void SqliteDB::Configure(OpenMode mode, uint32_t busy_timeout_ms) {
  // wait for locks instead of failing immediately
  Check(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms)), "busy_timeout");

  if (mode == OpenMode::kReadOnly) return;

  // rollback journal, not WAL: read-only opens must not need a -shm file
  Exec("PRAGMA journal_mode=DELETE;");

  // the slot is small; pay for full durability on every replace
  Exec("PRAGMA synchronous=FULL;");
}

} // namespace feedstore::store::sqlite
