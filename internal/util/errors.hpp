#pragma once

#include <stdexcept>
#include <string>

namespace feedstore::util {

/*
  Central error types.

  Thrown inside codecs and backends only. The backend boundary translates
  them to store::Result codes; callers of FeedStore never see them.
*/

class InvalidRecord : public std::invalid_argument {
 public:
  explicit InvalidRecord(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class CorruptSnapshot : public std::runtime_error {
 public:
  explicit CorruptSnapshot(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace feedstore::util
