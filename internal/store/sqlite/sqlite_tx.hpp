#pragma once

#include "sqlite_db.hpp"

namespace feedstore::store::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a failed replace never leaves a half-written slot

  Destructor rolls back unless Commit() succeeded.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      committed_ = false;
};

} // namespace feedstore::store::sqlite
