#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_backend.hpp"
#include "internal/store/serial/serial_feed_store.hpp"
#if FEEDSTORE_BACKEND_FILE
#include "internal/store/file/file_backend.hpp"
#endif
#if FEEDSTORE_BACKEND_SQLITE
#include "internal/store/sqlite/sqlite_backend.hpp"
#endif

namespace feedstore::factory {

using feedstore::runtime::config::StoreBackend;
using feedstore::runtime::config::StoreConfig;
using observability::StringField;

namespace {

constexpr uint32_t kDefaultBusyTimeoutMs = 5000;

} // namespace

store::CacheBackendPtr BuildBackend(const StoreConfig& config) {
  switch (config.backend()) {
    case StoreBackend::STORE_BACKEND_UNSPECIFIED:
    case StoreBackend::STORE_BACKEND_MEMORY:
      return std::make_unique<store::memory::MemoryBackend>();

    case StoreBackend::STORE_BACKEND_FILE:
#if FEEDSTORE_BACKEND_FILE
      return std::make_unique<store::file::FileBackend>(config.path(), config.fsync());
#else
      throw std::runtime_error("file backend not compiled in (FEEDSTORE_BACKEND_FILE=OFF)");
#endif

    case StoreBackend::STORE_BACKEND_SQLITE:
#if FEEDSTORE_BACKEND_SQLITE
    {
      const auto busy_timeout = config.sqlite().busy_timeout_ms() ? config.sqlite().busy_timeout_ms() : kDefaultBusyTimeoutMs;
      return std::make_unique<store::sqlite::SqliteBackend>(config.path(), busy_timeout);
    }
#else
      throw std::runtime_error("sqlite backend not compiled in (FEEDSTORE_BACKEND_SQLITE=OFF)");
#endif

    default:
      throw std::invalid_argument("unsupported store backend " + std::to_string(static_cast<int>(config.backend())));
  }
}

std::shared_ptr<store::FeedStore> BuildFeedStore(const feedstore::runtime::config::RuntimeConfig& config) {
  config::ValidateConfig(config);

  auto backend = BuildBackend(config.store());
  FEEDSTORE_LOG_INFO("Feed store ready", {StringField("backend", backend->Name()), StringField("path", config.store().path())});

  return std::make_shared<store::SerialFeedStore>(std::move(backend));
}

} // namespace feedstore::factory
