#include "snapshot_codec.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace feedstore::store::common {

feedstore::v1::FeedCache ToProto(const model::CachedFeed& cache) {
  feedstore::v1::FeedCache proto;
  proto.mutable_feed()->Reserve(static_cast<int>(cache.feed.size()));

  for (const auto& record : cache.feed) {
    auto* image = proto.add_feed();
    image->set_id(record.IdString());
    if (record.Description()) image->set_description(*record.Description());
    if (record.Location()) image->set_location(*record.Location());
    image->set_url(record.Url());
  }

  *proto.mutable_timestamp() = util::ToProto(cache.timestamp);
  return proto;
}

model::CachedFeed FromProto(const feedstore::v1::FeedCache& proto) {
  if (!proto.has_timestamp()) {
    throw util::CorruptSnapshot("snapshot has no timestamp");
  }
  if (!util::IsRepresentable(proto.timestamp())) {
    throw util::CorruptSnapshot("snapshot timestamp out of range");
  }

  model::CachedFeed cache;
  cache.feed.reserve(static_cast<size_t>(proto.feed_size()));

  for (const auto& image : proto.feed()) {
    std::optional<std::string> description;
    std::optional<std::string> location;
    if (image.has_description()) description = image.description();
    if (image.has_location()) location = image.location();

    try {
      cache.feed.push_back(model::FeedImageRecord::FromStrings(image.id(), std::move(description), std::move(location), image.url()));
    } catch (const util::InvalidRecord& e) {
      throw util::CorruptSnapshot(std::string("snapshot record: ") + e.what());
    }
  }

  cache.timestamp = util::FromProto(proto.timestamp());
  return cache;
}

std::string EncodeSnapshot(const model::CachedFeed& cache) {
  std::string bytes;
  if (!ToProto(cache).SerializeToString(&bytes)) {
    throw std::runtime_error("failed to serialize feed snapshot");
  }
  return bytes;
}

model::CachedFeed DecodeSnapshot(const std::string& bytes) {
  feedstore::v1::FeedCache proto;
  if (!proto.ParseFromString(bytes)) {
    throw util::CorruptSnapshot("snapshot bytes do not parse");
  }

  // this store is the only writer; anything unknown means foreign bytes
  if (!proto.GetReflection()->GetUnknownFields(proto).empty()) {
    throw util::CorruptSnapshot("snapshot carries unknown fields");
  }

  return FromProto(proto);
}

} // namespace feedstore::store::common
