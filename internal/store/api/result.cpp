#include "internal/store/api/result.hpp"

namespace feedstore::store {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::PermissionDenied:
      return "permission_denied";
    case ErrorCode::InvalidLocation:
      return "invalid_location";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace feedstore::store
