#pragma once

#include <optional>
#include <string>

#include "internal/util/uuid.hpp"

namespace feedstore::model {

/*
  One feed item as cached.

  Immutable once constructed. The constructor rejects a url that is not a
  syntactically valid absolute URL (util::InvalidRecord), so every instance
  that exists can be persisted and read back unchanged.
*/
class FeedImageRecord {
 public:
  FeedImageRecord(util::UUID id, std::optional<std::string> description, std::optional<std::string> location, std::string url);

  // Parses the canonical uuid text; throws util::InvalidRecord on a bad id or url.
  static FeedImageRecord FromStrings(const std::string& id, std::optional<std::string> description, std::optional<std::string> location,
                                     std::string url);

  const util::UUID& Id() const {
    return id_;
  }
  std::string IdString() const;

  const std::optional<std::string>& Description() const {
    return description_;
  }
  const std::optional<std::string>& Location() const {
    return location_;
  }
  const std::string& Url() const {
    return url_;
  }

  bool operator==(const FeedImageRecord&) const = default;

 private:
  util::UUID                 id_;
  std::optional<std::string> description_;
  std::optional<std::string> location_;
  std::string                url_;
};

} // namespace feedstore::model
