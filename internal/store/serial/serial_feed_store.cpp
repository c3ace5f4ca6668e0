#include "serial_feed_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace feedstore::store {

using observability::IntField;
using observability::StringField;

SerialFeedStore::SerialFeedStore(CacheBackendPtr backend) : backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("SerialFeedStore requires a backend");
  }
  worker_ = std::thread(&SerialFeedStore::Run, this);
}

SerialFeedStore::~SerialFeedStore() {
  queue_.Shutdown();
  if (worker_.joinable()) worker_.join();
}

// ------------------------------------------------------------------
// Submission
// ------------------------------------------------------------------

namespace {

Result ShuttingDown() {
  return Result::Err(ErrorCode::InternalError, "feed store is shutting down");
}

} // namespace

void SerialFeedStore::Retrieve(RetrievalCompletion completion) {
  const bool queued = Submit([this, completion] {
    auto result = ExecuteRetrieve();
    if (completion) completion(std::move(result));
  });
  if (!queued && completion) completion(RetrieveResult::Failure(ShuttingDown()));
}

void SerialFeedStore::Insert(model::CachedFeed cache, InsertionCompletion completion) {
  const bool queued = Submit([this, cache = std::move(cache), completion] {
    auto result = ExecuteInsert(cache);
    if (completion) completion(std::move(result));
  });
  if (!queued && completion) completion(ShuttingDown());
}

void SerialFeedStore::DeleteCachedFeed(DeletionCompletion completion) {
  const bool queued = Submit([this, completion] {
    auto result = ExecuteDelete();
    if (completion) completion(std::move(result));
  });
  if (!queued && completion) completion(ShuttingDown());
}

// Only fails for a completion that submits while the destructor is draining.
bool SerialFeedStore::Submit(OperationQueue::Operation op) {
  if (queue_.Enqueue(std::move(op))) return true;

  FEEDSTORE_LOG_WARN("Feed store rejected operation after shutdown", {StringField("backend", backend_->Name())});
  return false;
}

// ------------------------------------------------------------------
// Worker
// ------------------------------------------------------------------

void SerialFeedStore::Run() {
  while (auto op = queue_.Dequeue()) {
    try {
      (*op)();
    } catch (const std::exception& e) {
      FEEDSTORE_LOG_ERROR("Feed store completion threw", {StringField("backend", backend_->Name()), StringField("error", e.what())});
    } catch (...) {
      FEEDSTORE_LOG_ERROR("Feed store completion threw", {StringField("backend", backend_->Name()), StringField("error", "non-standard exception")});
    }
  }
}

RetrieveResult SerialFeedStore::ExecuteRetrieve() {
  try {
    auto result = backend_->Read();
    if (result.IsFailure()) {
      FEEDSTORE_LOG_WARN("Feed cache retrieve failed", {StringField("backend", backend_->Name()), StringField("code", ToString(result.error.code)),
                                                        StringField("error", result.error.message)});
    }
    return result;
  } catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR("Feed cache backend threw on read", {StringField("backend", backend_->Name()), StringField("error", e.what())});
    return RetrieveResult::Failure(Result::Err(ErrorCode::InternalError, e.what()));
  }
}

Result SerialFeedStore::ExecuteInsert(const model::CachedFeed& cache) {
  try {
    auto result = backend_->Write(cache);
    if (!result) {
      FEEDSTORE_LOG_WARN("Feed cache insert failed", {StringField("backend", backend_->Name()), StringField("code", ToString(result.code)),
                                                      StringField("error", result.message)});
    } else {
      FEEDSTORE_LOG_DEBUG("Feed cache inserted",
                          {StringField("backend", backend_->Name()), IntField("records", static_cast<int64_t>(cache.feed.size()))});
    }
    return result;
  } catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR("Feed cache backend threw on write", {StringField("backend", backend_->Name()), StringField("error", e.what())});
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

Result SerialFeedStore::ExecuteDelete() {
  try {
    auto result = backend_->Clear();
    if (!result) {
      FEEDSTORE_LOG_WARN("Feed cache delete failed", {StringField("backend", backend_->Name()), StringField("code", ToString(result.code)),
                                                      StringField("error", result.message)});
    }
    return result;
  } catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR("Feed cache backend threw on clear", {StringField("backend", backend_->Name()), StringField("error", e.what())});
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

} // namespace feedstore::store
