#include "internal/model/cached_feed.hpp"
#include "internal/model/feed_image.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"
#include "internal/util/uuid.hpp"

namespace {

using feedstore::model::CachedFeed;
using feedstore::model::FeedImageRecord;

template <typename Fn>
bool ThrowsInvalidRecord(Fn&& fn) {
  try {
    fn();
  } catch (const feedstore::util::InvalidRecord&) {
    return true;
  }
  return false;
}

void TestUuidTextRoundTripsAndIsCanonical() {
  const auto id   = feedstore::util::GenerateUUID();
  const auto text = feedstore::util::ToString(id);

  assert(text.size() == 36);
  assert(text[8] == '-' && text[13] == '-' && text[18] == '-' && text[23] == '-');
  assert(text[14] == '4');
  assert(feedstore::util::FromString(text) == id);

  const auto upper = feedstore::util::FromString("A0A0A0A0-0000-4000-8000-00000000000A");
  assert(feedstore::util::ToString(upper) == "a0a0a0a0-0000-4000-8000-00000000000a");
}

void TestUuidRejectsMalformedText() {
  assert(!feedstore::util::IsValidUUID(""));
  assert(!feedstore::util::IsValidUUID("a0a0a0a000004000800000000000000a"));
  assert(!feedstore::util::IsValidUUID("a0a0a0a0-0000-4000-8000-00000000000g"));
  assert(!feedstore::util::IsValidUUID("a0a0a0a0-00004-000-8000-00000000000a"));
  assert(feedstore::util::IsValidUUID("a0a0a0a0-0000-4000-8000-00000000000a"));
}

void TestUrlValidation() {
  using feedstore::util::IsValidUrl;

  assert(IsValidUrl("https://x/a.png"));
  assert(IsValidUrl("http://any-url.com"));
  assert(IsValidUrl("file:///tmp/image.jpg"));
  assert(IsValidUrl("custom+scheme.v1-2:opaque"));

  assert(!IsValidUrl(""));
  assert(!IsValidUrl("no-scheme"));
  assert(!IsValidUrl(":missing-scheme"));
  assert(!IsValidUrl("1http://digit-first"));
  assert(!IsValidUrl("https:"));
  assert(!IsValidUrl("https://with space"));
  assert(!IsValidUrl("ht tp://x"));
}

void TestRecordRejectsInvalidUrlAndId() {
  const auto id = feedstore::util::GenerateUUID();

  assert(ThrowsInvalidRecord([&] { FeedImageRecord(id, std::nullopt, std::nullopt, "not a url"); }));
  assert(ThrowsInvalidRecord([&] { FeedImageRecord::FromStrings("bad-id", std::nullopt, std::nullopt, "https://x/a.png"); }));
  assert(ThrowsInvalidRecord([&] { FeedImageRecord::FromStrings(feedstore::util::ToString(id), std::nullopt, std::nullopt, ""); }));
}

void TestRecordEqualityIsStructural() {
  const auto id = feedstore::util::GenerateUUID();

  FeedImageRecord a(id, "desc", std::nullopt, "https://x/a.png");
  FeedImageRecord b(id, "desc", std::nullopt, "https://x/a.png");
  assert(a == b);

  // absent and empty are different values
  FeedImageRecord empty_location(id, "desc", "", "https://x/a.png");
  assert(!(a == empty_location));

  FeedImageRecord other_url(id, "desc", std::nullopt, "https://x/b.png");
  assert(!(a == other_url));

  FeedImageRecord other_id(feedstore::util::GenerateUUID(), "desc", std::nullopt, "https://x/a.png");
  assert(!(a == other_id));
}

void TestCachedFeedEqualityIncludesOrderAndTimestamp() {
  FeedImageRecord first(feedstore::util::GenerateUUID(), std::nullopt, "NYC", "https://x/a.png");
  FeedImageRecord second(feedstore::util::GenerateUUID(), "d", std::nullopt, "https://x/b.png");

  const auto now = feedstore::util::Now();

  CachedFeed ordered{{first, second}, now};
  CachedFeed same{{first, second}, now};
  CachedFeed reversed{{second, first}, now};
  CachedFeed later{{first, second}, now + std::chrono::nanoseconds(1)};

  assert(ordered == same);
  assert(!(ordered == reversed));
  assert(!(ordered == later));

  CachedFeed empty_now{{}, now};
  assert(empty_now.feed.empty());
  assert(!(empty_now == ordered));
}

} // namespace

int main() {
  TestUuidTextRoundTripsAndIsCanonical();
  TestUuidRejectsMalformedText();
  TestUrlValidation();
  TestRecordRejectsInvalidUrlAndId();
  TestRecordEqualityIsStructural();
  TestCachedFeedEqualityIncludesOrderAndTimestamp();

  std::cout << "feedstore_unit_feed_image: pass\n";
  return 0;
}
