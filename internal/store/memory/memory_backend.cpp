#include "memory_backend.hpp"

namespace feedstore::store::memory {

RetrieveResult MemoryBackend::Read() {
  std::scoped_lock lock(mutex_);
  if (!slot_) return RetrieveResult::Empty();
  return RetrieveResult::Found(*slot_);
}

Result MemoryBackend::Write(const model::CachedFeed& cache) {
  // copy before taking the lock so the swap itself cannot fail halfway
  auto replacement = cache;

  std::scoped_lock lock(mutex_);
  slot_ = std::move(replacement);
  return Result::Ok();
}

Result MemoryBackend::Clear() {
  std::scoped_lock lock(mutex_);
  slot_.reset();
  return Result::Ok();
}

} // namespace feedstore::store::memory
