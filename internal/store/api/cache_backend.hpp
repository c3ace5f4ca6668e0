#pragma once

#include <memory>

#include "internal/model/cached_feed.hpp"
#include "internal/store/api/result.hpp"
#include "internal/store/api/retrieve_result.hpp"

namespace feedstore::store {

/*
  Durable slot abstraction.

  A backend owns exactly one slot at a fixed location chosen at construction.
  Calls are synchronous and may block on I/O. The serial wrapper guarantees
  that no two calls overlap, so implementations need no ordering logic of
  their own.

  GUARANTEES every implementation must give:

  - Read never mutates persisted state
  - Read reports a never-created location as Empty, undecodable bytes as
    Failure(Corruption)
  - Write replaces the whole slot atomically; on error the old slot survives
  - Clear on an empty/absent slot is Ok; on error the old slot survives
  - Nothing is thrown: every failure comes back as a Result

  Implementations:
    memory   → process-local optional<CachedFeed>
    file     → protobuf snapshot, tmp + rename
    sqlite   → one database file, BEGIN IMMEDIATE rewrite
*/
class CacheBackend {
 public:
  virtual ~CacheBackend() = default;

  virtual RetrieveResult Read() = 0;

  virtual Result Write(const model::CachedFeed& cache) = 0;

  virtual Result Clear() = 0;

  // short name for logs ("memory", "file", "sqlite")
  virtual const char* Name() const = 0;
};

using CacheBackendPtr = std::unique_ptr<CacheBackend>;

} // namespace feedstore::store
