#include "internal/model/feed_image.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace feedstore::model {

FeedImageRecord::FeedImageRecord(util::UUID id, std::optional<std::string> description, std::optional<std::string> location, std::string url)
    : id_(id), description_(std::move(description)), location_(std::move(location)), url_(std::move(url)) {
  if (!util::IsValidUrl(url_)) {
    throw util::InvalidRecord("feed image " + util::ToString(id_) + " has invalid url '" + url_ + "'");
  }
}

FeedImageRecord FeedImageRecord::FromStrings(const std::string& id, std::optional<std::string> description, std::optional<std::string> location,
                                             std::string url) {
  util::UUID parsed{};
  try {
    parsed = util::FromString(id);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidRecord(std::string("feed image id: ") + e.what());
  }
  return FeedImageRecord(parsed, std::move(description), std::move(location), std::move(url));
}

std::string FeedImageRecord::IdString() const {
  return util::ToString(id_);
}

} // namespace feedstore::model
