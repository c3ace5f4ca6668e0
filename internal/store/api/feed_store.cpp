#include "internal/store/api/feed_store.hpp"

#include <memory>

namespace feedstore::store {

std::future<RetrieveResult> FeedStore::Retrieve() {
  auto promise = std::make_shared<std::promise<RetrieveResult>>();
  auto future  = promise->get_future();
  Retrieve([promise](RetrieveResult result) { promise->set_value(std::move(result)); });
  return future;
}

std::future<Result> FeedStore::Insert(model::CachedFeed cache) {
  auto promise = std::make_shared<std::promise<Result>>();
  auto future  = promise->get_future();
  Insert(std::move(cache), [promise](Result result) { promise->set_value(std::move(result)); });
  return future;
}

std::future<Result> FeedStore::DeleteCachedFeed() {
  auto promise = std::make_shared<std::promise<Result>>();
  auto future  = promise->get_future();
  DeleteCachedFeed([promise](Result result) { promise->set_value(std::move(result)); });
  return future;
}

} // namespace feedstore::store
