#pragma once

#include <optional>
#include <utility>

#include "internal/model/cached_feed.hpp"
#include "internal/store/api/result.hpp"

namespace feedstore::store {

/*
  Outcome of a retrieval: Empty | Found(feed, timestamp) | Failure(error).

  Absence of the storage object is Empty, never Failure.
*/
struct RetrieveResult {
  enum class Kind { kEmpty, kFound, kFailure };

  Kind                             kind = Kind::kEmpty;
  std::optional<model::CachedFeed> cache;
  Result                           error;

  static RetrieveResult Empty() {
    return {};
  }

  static RetrieveResult Found(model::CachedFeed cache) {
    return {Kind::kFound, std::move(cache), Result::Ok()};
  }

  static RetrieveResult Failure(Result error) {
    return {Kind::kFailure, std::nullopt, std::move(error)};
  }

  bool IsEmpty() const {
    return kind == Kind::kEmpty;
  }
  bool IsFound() const {
    return kind == Kind::kFound;
  }
  bool IsFailure() const {
    return kind == Kind::kFailure;
  }

  bool operator==(const RetrieveResult&) const = default;
};

} // namespace feedstore::store
