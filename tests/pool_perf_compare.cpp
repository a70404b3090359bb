#include "poolkit/poolkit.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

namespace {

class BenchResource : public poolkit::pool::IResource {
 public:
  BenchResource() : uses(0) {}
  poolkit::api::Status Close() override { return poolkit::api::Status::Ok(); }
  std::uint64_t uses;
};

typedef std::chrono::high_resolution_clock Clock;

double SecondsSince(const Clock::time_point& start, const Clock::time_point& end) {
  return std::chrono::duration_cast<std::chrono::duration<double> >(end - start).count();
}

void PrintRow(const char* name, std::size_t iterations, double seconds) {
  const double ops_per_sec = seconds > 0.0 ? (static_cast<double>(iterations) / seconds) : 0.0;
  std::printf("%-30s iter=%zu sec=%.6f ops/s=%.2f\n", name, iterations, seconds, ops_per_sec);
}

// Acquire/release round trips from `threads` workers against one pool.
bool BenchPool(poolkit::pool::IdleQueueKind kind, std::size_t capacity, int threads,
               std::size_t iterations_per_thread, double* seconds_out,
               poolkit::pool::PoolStats* stats_out) {
  if (seconds_out == NULL || stats_out == NULL) return false;

  poolkit::pool::PoolOptions options;
  options.name = "bench";
  options.capacity = capacity;
  options.idle_queue = kind;
  options.log_events = false;
  poolkit::pool::ResourceFactory factory = []() {
    return poolkit::api::Result<poolkit::pool::ResourcePtr>(
        poolkit::pool::ResourcePtr(new BenchResource()));
  };
  poolkit::api::Result<poolkit::pool::IResourcePool*> created =
      poolkit::pool::CreateResourcePool(factory, options);
  if (!created.ok()) return false;
  poolkit::pool::IResourcePool* pool = created.value();

  std::atomic<int> failures(0);
  std::vector<std::thread> workers;
  const Clock::time_point begin = Clock::now();
  for (int t = 0; t < threads; ++t) {
    workers.push_back(std::thread([&]() {
      for (std::size_t i = 0; i < iterations_per_thread; ++i) {
        poolkit::api::Result<poolkit::pool::ResourcePtr> r = pool->Acquire();
        if (!r.ok()) {
          failures.fetch_add(1, std::memory_order_relaxed);
          return;
        }
        static_cast<BenchResource*>(r.value().get())->uses++;
        pool->ReleaseResource(r.value());
      }
    }));
  }
  for (std::size_t i = 0; i < workers.size(); ++i) workers[i].join();
  const Clock::time_point end = Clock::now();

  poolkit::api::Result<poolkit::pool::PoolStats> stats = pool->QueryStats();
  pool->Release();
  if (failures.load() != 0 || !stats.ok()) return false;
  *stats_out = stats.value();
  *seconds_out = SecondsSince(begin, end);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::size_t iterations = 200000;
  if (argc > 1) {
    const long long n = std::atoll(argv[1]);
    if (n > 0) iterations = static_cast<std::size_t>(n);
  }

  unsigned hw = std::thread::hardware_concurrency();
  const int threads = hw == 0 ? 4 : static_cast<int>(hw > 8 ? 8 : hw);
  const std::size_t capacity = 8;
  const std::size_t per_thread = iterations / static_cast<std::size_t>(threads);

  std::printf("[pool-perf] iterations=%zu threads=%d capacity=%zu\n", iterations, threads,
              capacity);

  const poolkit::pool::IdleQueueKind kinds[] = {
      poolkit::pool::IdleQueueKind::kMutex,
      poolkit::pool::IdleQueueKind::kLockFree,
  };
  const int thread_counts[] = {1, threads};

  for (std::size_t k = 0; k < sizeof(kinds) / sizeof(kinds[0]); ++k) {
    for (std::size_t t = 0; t < sizeof(thread_counts) / sizeof(thread_counts[0]); ++t) {
      const int n = thread_counts[t];
      const std::size_t per = n == 1 ? iterations : per_thread;
      double sec = 0.0;
      poolkit::pool::PoolStats stats;
      if (!BenchPool(kinds[k], capacity, n, per, &sec, &stats)) {
        std::printf("pool bench failed: %s threads=%d\n",
                    poolkit::pool::IdleQueueKindName(kinds[k]), n);
        return 1;
      }
      char label[64] = {0};
      std::snprintf(label, sizeof(label), "pool[%s] threads=%d",
                    poolkit::pool::IdleQueueKindName(kinds[k]), n);
      PrintRow(label, per * static_cast<std::size_t>(n), sec);
      std::printf("%-30s created=%llu discarded_full=%llu\n", "",
                  static_cast<unsigned long long>(stats.created),
                  static_cast<unsigned long long>(stats.discarded_full));
    }
  }

  return 0;
}
