#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "feedstore/v1/feed_cache.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/common/snapshot_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using feedstore::observability::StringField;
using feedstore::store::FeedStore;

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitUsage       = 1;
constexpr int kExitStoreFailed = 2;

void Usage() {
  std::cout << "Usage:\n"
            << "  feedstorectl --config <config.yaml> retrieve\n"
            << "  feedstorectl --config <config.yaml> insert <feed.json>\n"
            << "  feedstorectl --config <config.yaml> delete\n";
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

int Retrieve(FeedStore& store) {
  auto result = store.Retrieve().get();

  if (result.IsEmpty()) {
    std::cout << "empty\n";
    return kExitOk;
  }
  if (result.IsFailure()) {
    std::cerr << "retrieve failed: " << feedstore::store::ToString(result.error.code) << ": " << result.error.message << "\n";
    return kExitStoreFailed;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(feedstore::store::common::ToProto(*result.cache), &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render feed: " << status.ToString() << "\n";
    return kExitStoreFailed;
  }
  std::cout << json;
  return kExitOk;
}

int Insert(FeedStore& store, const std::string& feed_path) {
  feedstore::v1::FeedCache proto;
  auto status = google::protobuf::util::JsonStringToMessage(ReadFile(feed_path), &proto);
  if (!status.ok()) {
    std::cerr << "invalid feed document: " << status.ToString() << "\n";
    return kExitUsage;
  }
  if (!proto.has_timestamp()) {
    *proto.mutable_timestamp() = feedstore::util::ToProto(feedstore::util::Now());
  }

  feedstore::model::CachedFeed cache;
  try {
    cache = feedstore::store::common::FromProto(proto);
  } catch (const feedstore::util::CorruptSnapshot& e) {
    std::cerr << "invalid feed document: " << e.what() << "\n";
    return kExitUsage;
  }

  auto result = store.Insert(std::move(cache)).get();
  if (!result) {
    std::cerr << "insert failed: " << feedstore::store::ToString(result.code) << ": " << result.message << "\n";
    return kExitStoreFailed;
  }
  std::cout << "inserted " << proto.feed_size() << " records\n";
  return kExitOk;
}

int Delete(FeedStore& store) {
  auto result = store.DeleteCachedFeed().get();
  if (!result) {
    std::cerr << "delete failed: " << feedstore::store::ToString(result.code) << ": " << result.message << "\n";
    return kExitStoreFailed;
  }
  std::cout << "deleted\n";
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return kExitUsage;
  }

  const auto& config_path = args[1];
  const auto& command     = args[2];

  try {
    auto config = feedstore::config::ConfigLoader::LoadFromYaml(config_path);
    feedstore::observability::InitializeLogging(config);
    FEEDSTORE_LOG_INFO("feedstorectl starting", {StringField("command", command), StringField("config", config_path)});

    auto store = feedstore::factory::BuildFeedStore(config);

    int rc = kExitUsage;
    if (command == "retrieve" && args.size() == 3) {
      rc = Retrieve(*store);
    } else if (command == "insert" && args.size() == 4) {
      rc = Insert(*store, args[3]);
    } else if (command == "delete" && args.size() == 3) {
      rc = Delete(*store);
    } else {
      Usage();
    }

    store.reset();
    feedstore::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    feedstore::observability::ShutdownLogging();
    return kExitStoreFailed;
  }
}
