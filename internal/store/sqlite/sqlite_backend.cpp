#include "sqlite_backend.hpp"

#include <optional>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace feedstore::store::sqlite {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCreateCacheTable =
    "CREATE TABLE IF NOT EXISTS feed_cache (slot INTEGER PRIMARY KEY CHECK (slot = 1), timestamp_ns INTEGER NOT NULL);";

constexpr const char* kCreateImageTable =
    "CREATE TABLE IF NOT EXISTS feed_image (position INTEGER PRIMARY KEY, id TEXT NOT NULL, description TEXT, location TEXT, "
    "url TEXT NOT NULL);";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool Exists(const std::filesystem::path& path, std::filesystem::file_type* type) {
  std::error_code ec;
  const auto      status = std::filesystem::status(path, ec);
  *type                  = status.type();
  return status.type() != std::filesystem::file_type::not_found;
}

} // namespace

SqliteBackend::SqliteBackend(std::filesystem::path path, uint32_t busy_timeout_ms) : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms) {
}

Result SqliteBackend::Translate(const SqliteError& error) {
  switch (error.Code() & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, error.what());
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_FORMAT:
      return Result::Err(ErrorCode::Corruption, error.what());
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::InvalidLocation, error.what());
    case SQLITE_PERM:
    case SQLITE_READONLY:
    case SQLITE_AUTH:
      return Result::Err(ErrorCode::PermissionDenied, error.what());
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, error.what());
    default:
      return Result::Err(ErrorCode::InternalError, error.what());
  }
}

// ------------------------------------------------------------------
// Read
// ------------------------------------------------------------------

model::CachedFeed SqliteBackend::ReadSlot(SqliteDB& db) {
  model::CachedFeed cache;

  {
    auto st = db.Prepare("SELECT timestamp_ns FROM feed_cache WHERE slot = 1;");
    int  rc = sqlite3_step(st.get());
    db.Check(rc, "read feed_cache");
    if (rc != SQLITE_ROW) {
      throw util::CorruptSnapshot("feed_cache row missing");
    }
    cache.timestamp = util::FromUnixNanos(ColI64(st.get(), 0));
  }

  auto st = db.Prepare("SELECT id, description, location, url FROM feed_image ORDER BY position;");
  int  rc = 0;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    try {
      cache.feed.push_back(model::FeedImageRecord::FromStrings(ColText(st.get(), 0), ColOptionalText(st.get(), 1), ColOptionalText(st.get(), 2),
                                                               ColText(st.get(), 3)));
    } catch (const util::InvalidRecord& e) {
      throw util::CorruptSnapshot(std::string("feed_image row: ") + e.what());
    }
  }
  db.Check(rc, "read feed_image");

  return cache;
}

RetrieveResult SqliteBackend::Read() {
  std::filesystem::file_type type{};
  if (!Exists(path_, &type)) {
    return RetrieveResult::Empty();
  }
  if (type != std::filesystem::file_type::regular) {
    return RetrieveResult::Failure(Result::Err(ErrorCode::InvalidLocation, path_.string() + ": not a regular file"));
  }

  try {
    SqliteDB db(path_.string(), OpenMode::kReadOnly, busy_timeout_ms_);

    // snapshot both tables under one read lock
    db.Exec("BEGIN;");
    if (!db.TableExists("feed_cache")) {
      db.Exec("COMMIT;");
      return RetrieveResult::Empty();
    }

    std::optional<model::CachedFeed> cache;
    {
      auto st = db.Prepare("SELECT COUNT(*) FROM feed_cache;");
      db.Check(sqlite3_step(st.get()), "count feed_cache");
      if (ColI64(st.get(), 0) > 0) {
        cache = ReadSlot(db);
      }
    }
    db.Exec("COMMIT;");

    if (!cache) return RetrieveResult::Empty();
    return RetrieveResult::Found(std::move(*cache));
  } catch (const SqliteError& e) {
    auto result = Translate(e);
    FEEDSTORE_LOG_WARN("SQLite feed cache unreadable",
                       {StringField("path", path_.string()), StringField("code", ToString(result.code)), StringField("error", e.what())});
    return RetrieveResult::Failure(std::move(result));
  } catch (const util::CorruptSnapshot& e) {
    FEEDSTORE_LOG_WARN("SQLite feed cache is corrupt", {StringField("path", path_.string()), StringField("error", e.what())});
    return RetrieveResult::Failure(Result::Err(ErrorCode::Corruption, e.what()));
  }
}

// ------------------------------------------------------------------
// Write
// ------------------------------------------------------------------

Result SqliteBackend::Write(const model::CachedFeed& cache) {
  std::filesystem::file_type type{};
  if (Exists(path_, &type) && type == std::filesystem::file_type::directory) {
    return Result::Err(ErrorCode::InvalidLocation, path_.string() + ": is a directory");
  }

  try {
    SqliteDB          db(path_.string(), OpenMode::kCreate, busy_timeout_ms_);
    SqliteTransaction tx(db);

    db.Exec(kCreateCacheTable);
    db.Exec(kCreateImageTable);
    db.Exec("DELETE FROM feed_image;");
    db.Exec("DELETE FROM feed_cache;");

    {
      auto st = db.Prepare("INSERT INTO feed_cache(slot, timestamp_ns) VALUES(1, ?);");
      BindI64(st.get(), 1, util::ToUnixNanos(cache.timestamp));
      db.Check(sqlite3_step(st.get()), "insert feed_cache");
    }

    auto    st       = db.Prepare("INSERT INTO feed_image(position, id, description, location, url) VALUES(?,?,?,?,?);");
    int64_t position = 0;
    for (const auto& record : cache.feed) {
      sqlite3_reset(st.get());
      sqlite3_clear_bindings(st.get());

      BindI64(st.get(), 1, position++);
      BindText(st.get(), 2, record.IdString());
      BindOptionalText(st.get(), 3, record.Description());
      BindOptionalText(st.get(), 4, record.Location());
      BindText(st.get(), 5, record.Url());
      db.Check(sqlite3_step(st.get()), "insert feed_image");
    }

    tx.Commit();
    FEEDSTORE_LOG_DEBUG("SQLite feed cache replaced", {StringField("path", path_.string()), IntField("records", position)});
    return Result::Ok();
  } catch (const SqliteError& e) {
    auto result = Translate(e);
    FEEDSTORE_LOG_ERROR("SQLite feed cache write failed",
                        {StringField("path", path_.string()), StringField("code", ToString(result.code)), StringField("error", e.what())});
    return result;
  }
}

// ------------------------------------------------------------------
// Clear
// ------------------------------------------------------------------

Result SqliteBackend::Clear() {
  std::filesystem::file_type type{};
  if (!Exists(path_, &type)) {
    return Result::Ok();
  }
  if (type == std::filesystem::file_type::directory) {
    return Result::Err(ErrorCode::PermissionDenied, path_.string() + ": refusing to modify a directory");
  }

  try {
    SqliteDB          db(path_.string(), OpenMode::kReadWrite, busy_timeout_ms_);
    SqliteTransaction tx(db);

    if (db.TableExists("feed_cache")) {
      db.Exec("DELETE FROM feed_image;");
      db.Exec("DELETE FROM feed_cache;");
    }

    tx.Commit();
    return Result::Ok();
  } catch (const SqliteError& e) {
    auto result = Translate(e);
    FEEDSTORE_LOG_ERROR("SQLite feed cache delete failed",
                        {StringField("path", path_.string()), StringField("code", ToString(result.code)), StringField("error", e.what())});
    return result;
  }
}

} // namespace feedstore::store::sqlite
