#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/store/api/cache_backend.hpp"
#include "internal/store/api/feed_store.hpp"

namespace feedstore::factory {

/*
  BuildBackend / BuildFeedStore

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete backend types.
*/
store::CacheBackendPtr BuildBackend(const feedstore::runtime::config::StoreConfig& config);

std::shared_ptr<store::FeedStore> BuildFeedStore(const feedstore::runtime::config::RuntimeConfig& config);

} // namespace feedstore::factory
