#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace feedstore::store::file {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageUnavailable
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::StorageUnavailable(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageUnavailable(status.ToString());
}

/*
  Read entire file into a string
*/
inline std::string ReadAll(const std::string& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path));
  auto size   = Unwrap(file->GetSize());
  auto buffer = Unwrap(file->Read(size));
  Unwrap(file->Close());
  return buffer->ToString();
}

/*
  Write bytes to a fresh file at `path`, truncating any previous content.
*/
inline void WriteAll(const std::string& path, const std::string& bytes, bool fsync) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(path));
  Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));

  if (fsync) Unwrap(out->Flush());

  Unwrap(out->Close());
}

} // namespace feedstore::store::file
