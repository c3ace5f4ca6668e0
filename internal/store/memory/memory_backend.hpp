#pragma once

#include <mutex>
#include <optional>

#include "internal/store/api/cache_backend.hpp"

namespace feedstore::store::memory {

/*
  Reference backend: the slot lives in process memory.

  Never fails; useful as the baseline every other backend is compared to.
*/
class MemoryBackend final : public CacheBackend {
 public:
  MemoryBackend() = default;

  RetrieveResult Read() override;
  Result         Write(const model::CachedFeed& cache) override;
  Result         Clear() override;

  const char* Name() const override {
    return "memory";
  }

 private:
  std::mutex                       mutex_;
  std::optional<model::CachedFeed> slot_;
};

} // namespace feedstore::store::memory
