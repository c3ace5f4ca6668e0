#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/store/serial/serial_feed_store.hpp"
#include "internal/util/time.hpp"

namespace {

using feedstore::config::ConfigLoader;
using feedstore::runtime::config::RuntimeConfig;
using feedstore::runtime::config::StoreBackend;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "feedstore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "%v"
store:
  backend: STORE_BACKEND_SQLITE
  path: /var/lib/feedstore/feed.sqlite
  fsync: true
  sqlite:
    busy_timeout_ms: 250
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.store().backend() == StoreBackend::STORE_BACKEND_SQLITE);
  assert(config.store().path() == "/var/lib/feedstore/feed.sqlite");
  assert(config.store().fsync());
  assert(config.store().sqlite().busy_timeout_ms() == 250);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(store:
  backend: STORE_BACKEND_FILE
  path: "0755"
)");
  assert(config.store().path() == "0755");
}

void TestEmptyDocumentIsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.store().backend() == StoreBackend::STORE_BACKEND_UNSPECIFIED);
  assert(config.store().path().empty());
  assert(config.logging().level().empty());
}

void TestUnknownFieldsAreRejected() {
  assert(Throws<std::runtime_error>([] {
    ConfigLoader::LoadFromYamlString(R"(store:
  backend: STORE_BACKEND_MEMORY
  capacity: 3
)");
  }));

  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("unknown_section: {}\n"); }));
}

void TestUnknownBackendNameIsRejected() {
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_TAPE\n"); }));
}

void TestPathRequiredForDurableBackends() {
  assert(Throws<std::invalid_argument>([] { ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_FILE\n"); }));
  assert(Throws<std::invalid_argument>([] { ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_SQLITE\n"); }));

  const auto memory = ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_MEMORY\n");
  assert(memory.store().backend() == StoreBackend::STORE_BACKEND_MEMORY);
}

void TestMissingFileIsReported() {
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYaml("/nonexistent/feedstore/config.yaml"); }));
}

void TestMalformedYamlIsReported() {
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("store: [unterminated\n"); }));
}

void VerifyFactoryBuildsWorkingStore(const RuntimeConfig& config, const char* expected_backend) {
  auto store  = feedstore::factory::BuildFeedStore(config);
  auto serial = std::dynamic_pointer_cast<feedstore::store::SerialFeedStore>(store);
  assert(serial);
  assert(std::string(serial->BackendName()) == expected_backend);

  feedstore::model::CachedFeed cache;
  cache.timestamp = feedstore::util::Now();

  assert(store->Insert(cache).get());
  const auto found = store->Retrieve().get();
  assert(found.IsFound());
  assert(*found.cache == cache);
  assert(store->DeleteCachedFeed().get());
  assert(store->Retrieve().get().IsEmpty());
}

void TestFactoryBuildsConfiguredBackend() {
  VerifyFactoryBuildsWorkingStore(ConfigLoader::LoadFromYamlString(""), "memory");
  VerifyFactoryBuildsWorkingStore(ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_MEMORY\n"), "memory");

  const auto dir = std::filesystem::temp_directory_path() /
                   ("feedstore_factory_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);

#if FEEDSTORE_BACKEND_FILE
  VerifyFactoryBuildsWorkingStore(
      ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_FILE\n  path: " + (dir / "feed.pb").string() + "\n"), "file");
#endif
#if FEEDSTORE_BACKEND_SQLITE
  VerifyFactoryBuildsWorkingStore(
      ConfigLoader::LoadFromYamlString("store:\n  backend: STORE_BACKEND_SQLITE\n  path: " + (dir / "feed.sqlite").string() + "\n"), "sqlite");
#endif

  std::filesystem::remove_all(dir);
}

void TestFactoryRejectsInvalidConfig() {
  RuntimeConfig config;
  config.mutable_store()->set_backend(StoreBackend::STORE_BACKEND_FILE);
  assert(Throws<std::invalid_argument>([&] { feedstore::factory::BuildFeedStore(config); }));
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentIsDefaults();
  TestUnknownFieldsAreRejected();
  TestUnknownBackendNameIsRejected();
  TestPathRequiredForDurableBackends();
  TestMissingFileIsReported();
  TestMalformedYamlIsReported();
  TestFactoryBuildsConfiguredBackend();
  TestFactoryRejectsInvalidConfig();

  std::cout << "feedstore_unit_config_loader: pass\n";
  return 0;
}
