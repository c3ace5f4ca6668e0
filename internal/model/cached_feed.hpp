#pragma once

#include <vector>

#include "internal/model/feed_image.hpp"
#include "internal/util/time.hpp"

namespace feedstore::model {

/*
  Contents of the single cache slot.

  Order of `feed` is significant and must be preserved by every backend.
  An empty feed is still an occupied slot.
*/
struct CachedFeed {
  std::vector<FeedImageRecord> feed;
  util::TimePoint              timestamp{};

  bool operator==(const CachedFeed&) const = default;
};

} // namespace feedstore::model
