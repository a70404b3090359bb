#include "poolkit/poolkit.hpp"

#include <atomic>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

// Stand-in for a network connection: counts queries and reports on close.
class DemoConnection : public poolkit::pool::IResource {
 public:
  explicit DemoConnection(int id) : id_(id), queries_(0) {}

  void Query() { ++queries_; }

  poolkit::api::Status Close() override {
    std::ostringstream msg;
    msg << "connection #" << id_ << " closed after " << queries_ << " query(s)";
    poolkit::log::LogManager::Log(poolkit::log::LogSeverity::kInfo, msg.str());
    return poolkit::api::Status::Ok();
  }

 private:
  int id_;
  int queries_;
};

}  // namespace

int main(int argc, char* argv[]) {
  const std::string log_config = argc > 1 ? argv[1] : "config/logging.conf";
  const std::string pool_config = argc > 2 ? argv[2] : "config/pool.json";

  poolkit::api::Status st = poolkit::log::LogManager::Init(argv[0], log_config);
  if (!st.ok()) {
    std::fprintf(stderr, "LogManager::Init failed: %s\n", st.ToString().c_str());
    return 1;
  }

  poolkit::api::Result<poolkit::pool::PoolOptions> options =
      poolkit::pool::LoadPoolOptionsFromFile(pool_config);
  if (!options.ok()) {
    std::fprintf(stderr, "load pool options failed: %s\n", options.status().ToString().c_str());
    poolkit::log::LogManager::Shutdown();
    return 1;
  }

  std::atomic<int> next_id(1);
  poolkit::pool::ResourceFactory factory = [&next_id]() {
    return poolkit::api::Result<poolkit::pool::ResourcePtr>(
        poolkit::pool::ResourcePtr(new DemoConnection(next_id.fetch_add(1))));
  };

  poolkit::pool::IResourcePool* pool = poolkit_create_resource_pool(&factory, &options.value());
  if (pool == NULL) {
    std::fprintf(stderr, "create pool failed\n");
    poolkit::log::LogManager::Shutdown();
    return 1;
  }

  std::vector<std::thread> workers;
  for (int t = 0; t < 6; ++t) {
    workers.push_back(std::thread([pool]() {
      for (int i = 0; i < 20; ++i) {
        poolkit::pool::ResourceLease lease;
        poolkit::api::Status acquired = poolkit::pool::AcquireLease(pool, &lease);
        if (!acquired.ok()) {
          poolkit::log::LogManager::Log(poolkit::log::LogSeverity::kWarning,
                                        "acquire failed: " + acquired.ToString());
          return;
        }
        lease.As<DemoConnection>()->Query();
      }
    }));
  }
  for (std::size_t i = 0; i < workers.size(); ++i) workers[i].join();

  poolkit::api::Result<poolkit::pool::PoolStats> stats = pool->QueryStats();
  if (stats.ok()) {
    std::printf("capacity=%zu stats=%s\n", pool->Capacity(),
                poolkit::pool::DumpPoolStats(stats.value()).c_str());
  }

  pool->Close();
  poolkit::api::Result<poolkit::pool::ResourcePtr> late = pool->Acquire();
  std::printf("acquire after close: %s\n", late.status().ToString().c_str());

  poolkit_destroy_resource_pool(pool);
  poolkit::log::LogManager::Shutdown();
  return 0;
}
