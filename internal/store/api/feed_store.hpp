#pragma once

#include <functional>
#include <future>

#include "internal/model/cached_feed.hpp"
#include "internal/store/api/result.hpp"
#include "internal/store/api/retrieve_result.hpp"

namespace feedstore::store {

/*
  Feed cache store contract.

  CRITICAL GUARANTEES:

  - Every completion is invoked exactly once per call
  - Operations take effect, and complete, in submission order
  - Callers never need external locking
  - Failures arrive through the completion, never as exceptions

  Completions may run on a thread owned by the store. A completion may
  submit more operations, but must not block on a later operation of the
  same store.
*/
class FeedStore {
 public:
  using RetrievalCompletion = std::function<void(RetrieveResult)>;
  using InsertionCompletion = std::function<void(Result)>;
  using DeletionCompletion  = std::function<void(Result)>;

  virtual ~FeedStore() = default;

  virtual void Retrieve(RetrievalCompletion completion) = 0;

  // Replaces the slot with `cache` (feed + timestamp).
  virtual void Insert(model::CachedFeed cache, InsertionCompletion completion) = 0;

  virtual void DeleteCachedFeed(DeletionCompletion completion) = 0;

  // ---------------------------------------------------------------------
  // Future-based result channel, built on the completion form
  // ---------------------------------------------------------------------

  std::future<RetrieveResult> Retrieve();
  std::future<Result>         Insert(model::CachedFeed cache);
  std::future<Result>         DeleteCachedFeed();
};

} // namespace feedstore::store
