#pragma once

#include <filesystem>

#include "internal/store/api/cache_backend.hpp"

namespace feedstore::store::file {

/*
  Durable slot stored as one protobuf snapshot file.

  Properties:
    - atomic replace writes (write <path>.tmp → flush → rename)
    - missing file reads as Empty
    - undecodable file reads as Failure(Corruption) and is left in place
    - a directory at <path> is never written over or removed
*/
class FileBackend final : public CacheBackend {
 public:
  explicit FileBackend(std::filesystem::path path, bool fsync = false);

  RetrieveResult Read() override;
  Result         Write(const model::CachedFeed& cache) override;
  Result         Clear() override;

  const char* Name() const override {
    return "file";
  }

 private:
  std::filesystem::path path_;
  bool                  fsync_;
};

} // namespace feedstore::store::file
