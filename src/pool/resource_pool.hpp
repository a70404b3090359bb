#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "poolkit/concurrent/i_queue.hpp"
#include "poolkit/pool/i_resource_pool.hpp"

namespace poolkit {
namespace pool {

class ResourcePool : public IResourcePool {
 public:
  // options must already be validated (capacity > 0, factory non-empty).
  ResourcePool(const ResourceFactory& factory, const PoolOptions& options);
  ~ResourcePool() override;

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Result<ResourcePtr> Acquire() override;
  void ReleaseResource(const ResourcePtr& resource) override;
  void Close() override;

  PoolState State() const override;
  bool IsClosed() const override;
  std::size_t Capacity() const override;
  std::size_t IdleCount() const override;
  api::Result<PoolStats> QueryStats() const override;

 private:
  struct Counters {
    std::atomic<std::uint64_t> acquired_idle;
    std::atomic<std::uint64_t> created;
    std::atomic<std::uint64_t> factory_failures;
    std::atomic<std::uint64_t> rejected_closed;
    std::atomic<std::uint64_t> returned_idle;
    std::atomic<std::uint64_t> discarded_full;
    std::atomic<std::uint64_t> discarded_closed;
    std::atomic<std::uint64_t> drained;
    std::atomic<std::uint64_t> close_failures;
    Counters();
  };

  struct QueueReleaser {
    void operator()(concurrent::IQueue<ResourcePtr>* queue) const {
      if (queue != NULL) queue->Release();
    }
  };

  api::Result<ResourcePtr> CreateOne();
  void CloseOne(const ResourcePtr& resource, const char* reason);

  const ResourceFactory factory_;
  const PoolOptions options_;
  std::unique_ptr<concurrent::IQueue<ResourcePtr>, QueueReleaser> idle_;
  // Serializes ReleaseResource against Close. Acquire never takes it.
  std::mutex mu_;
  std::atomic<bool> closed_;
  Counters counters_;
};

}  // namespace pool
}  // namespace poolkit
