#pragma once

#include <string>

#include "feedstore/v1/feed_cache.pb.h"
#include "internal/model/cached_feed.hpp"

namespace feedstore::store::common {

/*
  CachedFeed <-> feedstore.v1.FeedCache

  Decoding is strict: a snapshot that does not parse, carries fields this
  build does not know, lacks a timestamp, or holds a record with a bad id or
  url throws util::CorruptSnapshot. Nothing is skipped silently.
*/

feedstore::v1::FeedCache ToProto(const model::CachedFeed& cache);
model::CachedFeed        FromProto(const feedstore::v1::FeedCache& proto);

std::string       EncodeSnapshot(const model::CachedFeed& cache);
model::CachedFeed DecodeSnapshot(const std::string& bytes);

} // namespace feedstore::store::common
