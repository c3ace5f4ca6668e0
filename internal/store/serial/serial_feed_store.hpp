#pragma once

#include <thread>

#include "internal/store/api/cache_backend.hpp"
#include "internal/store/api/feed_store.hpp"
#include "operation_queue.hpp"

namespace feedstore::store {

/*
  FeedStore over any CacheBackend, with strict FIFO semantics.

  One worker thread owns the backend. Operations run one at a time in the
  order they entered the queue, and each completion is invoked on the worker
  before the next operation starts. Backend internals are free to be
  concurrent; nothing of that is observable through this class.

  The destructor finishes every operation already submitted, then joins.
  An operation submitted by a completion once the destructor has started is
  not run; its completion gets an InternalError result on the calling thread.
*/
class SerialFeedStore final : public FeedStore {
 public:
  explicit SerialFeedStore(CacheBackendPtr backend);
  ~SerialFeedStore() override;

  SerialFeedStore(const SerialFeedStore&)            = delete;
  SerialFeedStore& operator=(const SerialFeedStore&) = delete;

  using FeedStore::DeleteCachedFeed;
  using FeedStore::Insert;
  using FeedStore::Retrieve;

  void Retrieve(RetrievalCompletion completion) override;
  void Insert(model::CachedFeed cache, InsertionCompletion completion) override;
  void DeleteCachedFeed(DeletionCompletion completion) override;

  const char* BackendName() const {
    return backend_->Name();
  }

 private:
  bool Submit(OperationQueue::Operation op);
  void Run();

  RetrieveResult ExecuteRetrieve();
  Result         ExecuteInsert(const model::CachedFeed& cache);
  Result         ExecuteDelete();

  CacheBackendPtr backend_;
  OperationQueue  queue_;
  std::thread     worker_;
};

} // namespace feedstore::store
