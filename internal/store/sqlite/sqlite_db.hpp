#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace feedstore::store::sqlite {

/*
  Error raised by SqliteDB; carries the primary sqlite result code so the
  backend can translate it into a store::ErrorCode.
*/
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

enum class OpenMode {
  kReadOnly,
  kReadWrite,
  // read-write, creating the file when missing
  kCreate,
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*
  Thin RAII wrapper around sqlite3*.

  One instance per store operation; the slot file is never held open
  between operations, so a missing file stays missing until a write.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, OpenMode mode, uint32_t busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/DDL/transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement; finalized when the returned pointer goes away
  StatementPtr Prepare(const std::string& sql);

  // Throws SqliteError unless rc is one of the success codes.
  void Check(int rc, const char* what) const;

  bool TableExists(const std::string& table);

 private:
  void Configure(OpenMode mode, uint32_t busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace feedstore::store::sqlite
