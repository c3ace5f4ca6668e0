#include "internal/store/file/file_backend.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using feedstore::model::CachedFeed;
using feedstore::store::ErrorCode;
using feedstore::store::file::FileBackend;

std::filesystem::path MakeTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("feedstore_file_backend_" + name + "_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void WriteBytes(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << bytes;
}

std::string ReadBytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

CachedFeed SampleCache() {
  CachedFeed cache;
  cache.feed.emplace_back(feedstore::util::GenerateUUID(), std::nullopt, "NYC", "https://x/a.png");
  cache.timestamp = feedstore::util::Now();
  return cache;
}

void TestReadOfMissingFileCreatesNothing() {
  const auto  dir = MakeTempDir("missing");
  FileBackend backend(dir / "feed.pb");

  assert(backend.Read().IsEmpty());
  assert(std::filesystem::is_empty(dir));

  std::filesystem::remove_all(dir);
}

void TestWriteLeavesNoTemporaryFile() {
  const auto  dir = MakeTempDir("tmp");
  FileBackend backend(dir / "feed.pb", true);

  assert(backend.Write(SampleCache()));
  assert(std::filesystem::exists(dir / "feed.pb"));
  assert(!std::filesystem::exists(dir / "feed.pb.tmp"));

  std::filesystem::remove_all(dir);
}

void TestStaleTemporaryFileIsIgnoredAndReplaced() {
  const auto  dir = MakeTempDir("stale_tmp");
  FileBackend backend(dir / "feed.pb");

  WriteBytes(dir / "feed.pb.tmp", "left over from a crash");
  assert(backend.Read().IsEmpty());

  const auto cache = SampleCache();
  assert(backend.Write(cache));
  assert(*backend.Read().cache == cache);

  std::filesystem::remove_all(dir);
}

void TestCorruptFileIsReportedAndKept() {
  const auto  dir  = MakeTempDir("corrupt");
  const auto  path = dir / "feed.pb";
  FileBackend backend(path);

  WriteBytes(path, "invalidData");

  const auto first = backend.Read();
  assert(first.IsFailure());
  assert(first.error.code == ErrorCode::Corruption);
  assert(backend.Read() == first);
  assert(ReadBytes(path) == "invalidData");

  std::filesystem::remove_all(dir);
}

void TestInsertAndDeleteRecoverCorruptFile() {
  const auto  dir  = MakeTempDir("recover");
  const auto  path = dir / "feed.pb";
  FileBackend backend(path);

  WriteBytes(path, "invalidData");
  const auto cache = SampleCache();
  assert(backend.Write(cache));
  assert(*backend.Read().cache == cache);

  WriteBytes(path, "invalidData");
  assert(backend.Clear());
  assert(!std::filesystem::exists(path));
  assert(backend.Read().IsEmpty());

  std::filesystem::remove_all(dir);
}

void TestDirectoryAtPathIsNeverTouched() {
  const auto dir = MakeTempDir("directory");
  FileBackend backend(dir);

  const auto read = backend.Read();
  assert(read.IsFailure());
  assert(read.error.code == ErrorCode::InvalidLocation);

  const auto write = backend.Write(SampleCache());
  assert(!write);
  assert(write.code == ErrorCode::InvalidLocation);

  const auto clear = backend.Clear();
  assert(!clear);
  assert(clear.code == ErrorCode::PermissionDenied);

  assert(std::filesystem::is_directory(dir));
  std::filesystem::remove_all(dir);
}

void TestWriteUnderMissingDirectoryFails() {
  const auto  dir = MakeTempDir("no_parent");
  FileBackend backend(dir / "missing" / "feed.pb");

  assert(!backend.Write(SampleCache()));
  assert(backend.Read().IsEmpty());
  assert(backend.Clear());

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestReadOfMissingFileCreatesNothing();
  TestWriteLeavesNoTemporaryFile();
  TestStaleTemporaryFileIsIgnoredAndReplaced();
  TestCorruptFileIsReportedAndKept();
  TestInsertAndDeleteRecoverCorruptFile();
  TestDirectoryAtPathIsNeverTouched();
  TestWriteUnderMissingDirectoryFails();

  std::cout << "feedstore_unit_file_backend: pass\n";
  return 0;
}
