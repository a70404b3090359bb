#include "poolkit/pool/pool_options.hpp"

#include <string>

#include "poolkit/json/i_json.hpp"

namespace poolkit {
namespace pool {

#define PK_STATUS(message) \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message), api::ErrorModule::kPool, \
                          api::kPoolInvalidOptions)

namespace {

api::Status ParseQueueKind(const std::string& value, IdleQueueKind* out) {
  if (value == "mutex" || value == "basic") {
    *out = IdleQueueKind::kMutex;
    return api::Status::Ok();
  }
  if (value == "lockfree" || value == "lock_free" || value == "moodycamel") {
    *out = IdleQueueKind::kLockFree;
    return api::Status::Ok();
  }
  return PK_STATUS("pool.idle_queue is invalid: " + value);
}

api::Result<PoolOptions> FromJson(const json::Json& doc) {
  if (!doc.is_object() || !doc.contains("pool") || !doc["pool"].is_object()) {
    return api::Result<PoolOptions>(PK_STATUS("missing \"pool\" object"));
  }
  const json::Json& node = doc["pool"];
  PoolOptions options;

  if (node.contains("name")) {
    if (!node["name"].is_string()) {
      return api::Result<PoolOptions>(PK_STATUS("pool.name must be a string"));
    }
    options.name = node["name"].get<std::string>();
  }

  if (node.contains("capacity")) {
    // is_number_unsigned is false for negative literals, which are rejected here too.
    if (!node["capacity"].is_number_unsigned()) {
      return api::Result<PoolOptions>(PK_STATUS("pool.capacity must be a positive integer"));
    }
    options.capacity = node["capacity"].get<std::size_t>();
  }
  if (options.capacity == 0) {
    return api::Result<PoolOptions>(PK_STATUS("pool.capacity must be a positive integer"));
  }

  if (node.contains("idle_queue")) {
    if (!node["idle_queue"].is_string()) {
      return api::Result<PoolOptions>(PK_STATUS("pool.idle_queue must be a string"));
    }
    api::Status st = ParseQueueKind(node["idle_queue"].get<std::string>(), &options.idle_queue);
    if (!st.ok()) return api::Result<PoolOptions>(st);
  }

  if (node.contains("log_events")) {
    if (!node["log_events"].is_boolean()) {
      return api::Result<PoolOptions>(PK_STATUS("pool.log_events must be a boolean"));
    }
    options.log_events = node["log_events"].get<bool>();
  }

  return api::Result<PoolOptions>(options);
}

}  // namespace

const char* IdleQueueKindName(IdleQueueKind kind) {
  switch (kind) {
    case IdleQueueKind::kMutex:
      return "mutex";
    case IdleQueueKind::kLockFree:
      return "lockfree";
    default:
      return "unknown";
  }
}

std::string DumpPoolStats(const PoolStats& stats, int indent) {
  json::Json doc = json::Json::object();
  doc["acquired_idle"] = stats.acquired_idle;
  doc["created"] = stats.created;
  doc["factory_failures"] = stats.factory_failures;
  doc["rejected_closed"] = stats.rejected_closed;
  doc["returned_idle"] = stats.returned_idle;
  doc["discarded_full"] = stats.discarded_full;
  doc["discarded_closed"] = stats.discarded_closed;
  doc["drained"] = stats.drained;
  doc["close_failures"] = stats.close_failures;
  doc["idle"] = stats.idle;
  return json::JsonCodec::Dump(doc, indent);
}

api::Result<PoolOptions> ParsePoolOptions(const std::string& json_text) {
  api::Result<json::Json> doc = json::JsonCodec::Parse(json_text);
  if (!doc.ok()) return api::Result<PoolOptions>(doc.status());
  return FromJson(doc.value());
}

api::Result<PoolOptions> LoadPoolOptionsFromFile(const std::string& path) {
  api::Result<json::Json> doc = json::JsonCodec::LoadFile(path);
  if (!doc.ok()) return api::Result<PoolOptions>(doc.status());
  return FromJson(doc.value());
}

#undef PK_STATUS

}  // namespace pool
}  // namespace poolkit
