#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"

namespace poolkit {
namespace pool {

enum class IdleQueueKind : std::uint8_t {
  kMutex = 0,     // mutex + deque, strict FIFO
  kLockFree = 1,  // moodycamel::ConcurrentQueue, FIFO per producer
};

struct PoolOptions {
  std::string name = "pool";
  std::size_t capacity = 0;  // max idle resources retained, must be > 0
  IdleQueueKind idle_queue = IdleQueueKind::kMutex;
  bool log_events = true;    // VLOG(1) acquire/release events
};

enum class PoolState : std::uint8_t { kOpen = 0, kClosed = 1 };

struct PoolStats {
  std::uint64_t acquired_idle = 0;
  std::uint64_t created = 0;
  std::uint64_t factory_failures = 0;
  std::uint64_t rejected_closed = 0;
  std::uint64_t returned_idle = 0;
  std::uint64_t discarded_full = 0;
  std::uint64_t discarded_closed = 0;
  std::uint64_t drained = 0;
  std::uint64_t close_failures = 0;
  std::size_t idle = 0;
};

POOLKIT_API const char* IdleQueueKindName(IdleQueueKind kind);

// Serialize a stats snapshot as a JSON object keyed by counter name.
// indent < 0 produces a single line.
POOLKIT_API std::string DumpPoolStats(const PoolStats& stats, int indent = -1);

// Parse pool options from a JSON document.
// Supported schema:
// {
//   "pool": {
//     "name": "db",
//     "capacity": 8,
//     "idle_queue": "mutex|lockfree",
//     "log_events": true|false
//   }
// }
// "capacity" is required; other missing keys keep their defaults.
// Returns kInvalidArgument (POOL_INVALID_OPTIONS) for a malformed document.
POOLKIT_API api::Result<PoolOptions> ParsePoolOptions(const std::string& json_text);

// Load pool options from a JSON config file. Returns kNotFound when the file
// cannot be opened.
POOLKIT_API api::Result<PoolOptions> LoadPoolOptionsFromFile(const std::string& path);

}  // namespace pool
}  // namespace poolkit
