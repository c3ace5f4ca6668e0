#pragma once

#include <string>
#include <string_view>

namespace feedstore::store {

/*
  Portable store result codes.

  Every backend must translate its own errors (sqlite, arrow, protobuf,
  filesystem) into these. Upper layers never depend on backend error types.
*/

enum class ErrorCode {
  OK = 0,

  // storage exists but cannot be decoded
  Corruption,

  IOError,
  PermissionDenied,
  InvalidLocation,

  Busy,

  InternalError
};

std::string_view ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  bool operator==(const Result&) const = default;
};

} // namespace feedstore::store
