#include "file_backend.hpp"

#include <system_error>

#include "arrow_io.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/store/common/snapshot_codec.hpp"

namespace feedstore::store::file {

using common::DecodeSnapshot;
using common::EncodeSnapshot;

using observability::BoolField;
using observability::StringField;

namespace {

ErrorCode FromErrc(const std::error_code& ec) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted || ec == std::errc::read_only_file_system) {
    return ErrorCode::PermissionDenied;
  }
  if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory || ec == std::errc::is_a_directory) {
    return ErrorCode::InvalidLocation;
  }
  return ErrorCode::IOError;
}

} // namespace

FileBackend::FileBackend(std::filesystem::path path, bool fsync) : path_(std::move(path)), fsync_(fsync) {
}

RetrieveResult FileBackend::Read() {
  std::error_code ec;
  const auto      status = std::filesystem::status(path_, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return RetrieveResult::Empty();
  }
  if (ec) {
    return RetrieveResult::Failure(Result::Err(FromErrc(ec), path_.string() + ": " + ec.message()));
  }
  if (status.type() != std::filesystem::file_type::regular) {
    return RetrieveResult::Failure(Result::Err(ErrorCode::InvalidLocation, path_.string() + ": not a regular file"));
  }

  try {
    return RetrieveResult::Found(DecodeSnapshot(ReadAll(path_.string())));
  } catch (const util::CorruptSnapshot& e) {
    FEEDSTORE_LOG_WARN("Feed cache snapshot is corrupt", {StringField("path", path_.string()), StringField("error", e.what())});
    return RetrieveResult::Failure(Result::Err(ErrorCode::Corruption, e.what()));
  } catch (const util::StorageUnavailable& e) {
    FEEDSTORE_LOG_ERROR("Feed cache snapshot unreadable", {StringField("path", path_.string()), StringField("error", e.what())});
    return RetrieveResult::Failure(Result::Err(ErrorCode::IOError, e.what()));
  }
}

/*
  Atomic write:
      write tmp → flush → rename
*/
Result FileBackend::Write(const model::CachedFeed& cache) {
  std::error_code ec;
  if (std::filesystem::is_directory(path_, ec)) {
    return Result::Err(ErrorCode::InvalidLocation, path_.string() + ": is a directory");
  }

  const auto tmp_path = path_.string() + ".tmp";

  try {
    WriteAll(tmp_path, EncodeSnapshot(cache), fsync_);
  } catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR("Feed cache snapshot write failed", {StringField("path", tmp_path), StringField("error", e.what())});
    std::filesystem::remove(tmp_path, ec);
    return Result::Err(ErrorCode::IOError, e.what());
  }

  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    const auto code = FromErrc(ec);
    FEEDSTORE_LOG_ERROR("Feed cache snapshot rename failed", {StringField("path", path_.string()), StringField("error", ec.message())});
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return Result::Err(code, path_.string() + ": " + ec.message());
  }

  FEEDSTORE_LOG_DEBUG("Feed cache snapshot replaced", {StringField("path", path_.string()), BoolField("fsync", fsync_)});
  return Result::Ok();
}

Result FileBackend::Clear() {
  std::error_code ec;
  const auto      status = std::filesystem::symlink_status(path_, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return Result::Ok();
  }
  if (ec) {
    return Result::Err(FromErrc(ec), path_.string() + ": " + ec.message());
  }
  if (status.type() == std::filesystem::file_type::directory) {
    return Result::Err(ErrorCode::PermissionDenied, path_.string() + ": refusing to remove a directory");
  }

  std::filesystem::remove(path_, ec);
  if (ec) {
    FEEDSTORE_LOG_ERROR("Feed cache snapshot delete failed", {StringField("path", path_.string()), StringField("error", ec.message())});
    return Result::Err(FromErrc(ec), path_.string() + ": " + ec.message());
  }
  return Result::Ok();
}

} // namespace feedstore::store::file
