#pragma once

#include <cstdint>
#include <filesystem>

#include "internal/store/api/cache_backend.hpp"
#include "sqlite_db.hpp"

namespace feedstore::store::sqlite {

/*
  Embedded-database slot.

  Schema (created on first write, inside the write transaction):

    feed_cache(slot = 1, timestamp_ns)
    feed_image(position, id, description, location, url)

  A missing database file, or one without the feed_cache table, reads as
  Empty. Reads open the file read-only.
*/
class SqliteBackend final : public CacheBackend {
 public:
  explicit SqliteBackend(std::filesystem::path path, uint32_t busy_timeout_ms = 5000);

  RetrieveResult Read() override;
  Result         Write(const model::CachedFeed& cache) override;
  Result         Clear() override;

  const char* Name() const override {
    return "sqlite";
  }

  static Result Translate(const SqliteError& error);

 private:
  model::CachedFeed ReadSlot(SqliteDB& db);

  std::filesystem::path path_;
  uint32_t              busy_timeout_ms_;
};

} // namespace feedstore::store::sqlite
