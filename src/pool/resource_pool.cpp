#include "pool/resource_pool.hpp"

#include <exception>

#include <glog/logging.h>

#include "concurrent/basic_queue_impl.hpp"
#include "concurrent/moodycamel_queue_impl.hpp"
#include "poolkit/api/version.hpp"

namespace poolkit {
namespace pool {

#define PK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kPool, (detail))

namespace {

concurrent::IQueue<ResourcePtr>* MakeIdleQueue(IdleQueueKind kind, std::size_t capacity) {
  switch (kind) {
    case IdleQueueKind::kLockFree:
      return new concurrent::MoodycamelQueue<ResourcePtr>(capacity);
    case IdleQueueKind::kMutex:
    default:
      return new concurrent::BasicMutexQueue<ResourcePtr>(capacity);
  }
}

}  // namespace

ResourcePool::Counters::Counters()
    : acquired_idle(0),
      created(0),
      factory_failures(0),
      rejected_closed(0),
      returned_idle(0),
      discarded_full(0),
      discarded_closed(0),
      drained(0),
      close_failures(0) {}

ResourcePool::ResourcePool(const ResourceFactory& factory, const PoolOptions& options)
    : factory_(factory),
      options_(options),
      idle_(MakeIdleQueue(options.idle_queue, options.capacity)),
      closed_(false) {
  VLOG(1) << "pool[" << options_.name << "] created: capacity=" << options_.capacity
          << " idle_queue=" << IdleQueueKindName(options_.idle_queue) << " (" << idle_->Name()
          << ")";
}

ResourcePool::~ResourcePool() { Close(); }

const char* ResourcePool::Name() const { return "poolkit.pool.resource_pool"; }
std::uint32_t ResourcePool::ApiVersion() const { return api::kApiVersion; }
void ResourcePool::Release() { delete this; }

api::Result<ResourcePtr> ResourcePool::Acquire() {
  api::Result<ResourcePtr> idle = idle_->TryPop();
  if (idle.ok()) {
    counters_.acquired_idle.fetch_add(1, std::memory_order_relaxed);
    if (options_.log_events) {
      VLOG(1) << "pool[" << options_.name << "] acquire: served from idle";
    }
    return idle;
  }

  // Lock-free fast path: a Close that lands after this check still lets the
  // factory run. ReleaseResource discards such a resource later.
  if (closed_.load(std::memory_order_acquire)) {
    counters_.rejected_closed.fetch_add(1, std::memory_order_relaxed);
    return api::Result<ResourcePtr>(
        PK_STATUS(api::StatusCode::kClosed, "pool has been closed", api::kPoolClosed));
  }

  if (options_.log_events) {
    VLOG(1) << "pool[" << options_.name << "] acquire: served via factory";
  }
  return CreateOne();
}

void ResourcePool::ReleaseResource(const ResourcePtr& resource) {
  if (!resource) {
    LOG(WARNING) << "pool[" << options_.name << "] release: ignoring null resource";
    return;
  }

  bool stored = false;
  bool closed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed = closed_.load(std::memory_order_relaxed);
    if (!closed) {
      api::Status pushed = idle_->TryPush(resource);
      stored = pushed.ok();
      if (!stored && pushed.code() != api::StatusCode::kWouldBlock) {
        LOG(WARNING) << "pool[" << options_.name
                     << "] release: idle queue push failed: " << pushed.ToString();
      }
    }
  }

  if (stored) {
    counters_.returned_idle.fetch_add(1, std::memory_order_relaxed);
    if (options_.log_events) {
      VLOG(1) << "pool[" << options_.name << "] release: returned to idle";
    }
    return;
  }

  // The resource was never stored, so it can be closed outside mu_.
  if (closed) {
    counters_.discarded_closed.fetch_add(1, std::memory_order_relaxed);
    CloseOne(resource, "pool closed");
  } else {
    counters_.discarded_full.fetch_add(1, std::memory_order_relaxed);
    if (options_.log_events) {
      VLOG(1) << "pool[" << options_.name << "] release: idle full, discarding";
    }
    CloseOne(resource, "idle full");
  }
}

void ResourcePool::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_.load(std::memory_order_relaxed)) return;
  closed_.store(true, std::memory_order_release);

  std::uint64_t drained = 0;
  for (;;) {
    api::Result<ResourcePtr> r = idle_->TryPop();
    if (!r.ok()) break;
    CloseOne(r.value(), "drain");
    ++drained;
  }
  counters_.drained.fetch_add(drained, std::memory_order_relaxed);
  LOG(INFO) << "pool[" << options_.name << "] closed, drained " << drained
            << " idle resource(s)";
}

PoolState ResourcePool::State() const {
  return closed_.load(std::memory_order_acquire) ? PoolState::kClosed : PoolState::kOpen;
}

bool ResourcePool::IsClosed() const { return closed_.load(std::memory_order_acquire); }

std::size_t ResourcePool::Capacity() const { return options_.capacity; }

std::size_t ResourcePool::IdleCount() const { return idle_->ApproxSize(); }

api::Result<PoolStats> ResourcePool::QueryStats() const {
  PoolStats stats;
  stats.acquired_idle = counters_.acquired_idle.load(std::memory_order_relaxed);
  stats.created = counters_.created.load(std::memory_order_relaxed);
  stats.factory_failures = counters_.factory_failures.load(std::memory_order_relaxed);
  stats.rejected_closed = counters_.rejected_closed.load(std::memory_order_relaxed);
  stats.returned_idle = counters_.returned_idle.load(std::memory_order_relaxed);
  stats.discarded_full = counters_.discarded_full.load(std::memory_order_relaxed);
  stats.discarded_closed = counters_.discarded_closed.load(std::memory_order_relaxed);
  stats.drained = counters_.drained.load(std::memory_order_relaxed);
  stats.close_failures = counters_.close_failures.load(std::memory_order_relaxed);
  stats.idle = idle_->ApproxSize();
  return api::Result<PoolStats>(stats);
}

api::Result<ResourcePtr> ResourcePool::CreateOne() {
  try {
    api::Result<ResourcePtr> created = factory_();
    if (!created.ok()) {
      counters_.factory_failures.fetch_add(1, std::memory_order_relaxed);
      return created;
    }
    if (!created.value()) {
      counters_.factory_failures.fetch_add(1, std::memory_order_relaxed);
      return api::Result<ResourcePtr>(PK_STATUS(
          api::StatusCode::kInternalError, "resource factory returned null", api::kPoolFactoryNull));
    }
    counters_.created.fetch_add(1, std::memory_order_relaxed);
    return created;
  } catch (const std::exception& ex) {
    counters_.factory_failures.fetch_add(1, std::memory_order_relaxed);
    return api::Result<ResourcePtr>(
        PK_STATUS(api::StatusCode::kInternalError,
                  std::string("resource factory threw: ") + ex.what(), api::kPoolFactoryThrew));
  } catch (...) {
    counters_.factory_failures.fetch_add(1, std::memory_order_relaxed);
    return api::Result<ResourcePtr>(PK_STATUS(api::StatusCode::kInternalError,
                                              "resource factory threw a non-std exception",
                                              api::kPoolFactoryThrew));
  }
}

void ResourcePool::CloseOne(const ResourcePtr& resource, const char* reason) {
  api::Status st;
  try {
    st = resource->Close();
  } catch (const std::exception& ex) {
    st = PK_STATUS(api::StatusCode::kIoError, std::string("resource close threw: ") + ex.what(),
                   api::kPoolResourceCloseFailed);
  } catch (...) {
    st = PK_STATUS(api::StatusCode::kIoError, "resource close threw a non-std exception",
                   api::kPoolResourceCloseFailed);
  }
  if (!st.ok()) {
    counters_.close_failures.fetch_add(1, std::memory_order_relaxed);
    LOG(WARNING) << "pool[" << options_.name << "] close (" << reason
                 << ") failed: " << st.ToString();
  }
}

#undef PK_STATUS

api::Result<IResourcePool*> CreateResourcePool(const ResourceFactory& factory,
                                               const PoolOptions& options) {
  if (options.capacity == 0) {
    return api::Result<IResourcePool*>(
        api::Status::FromModule(api::StatusCode::kInvalidArgument, "capacity must be positive",
                                api::ErrorModule::kPool, api::kPoolInvalidCapacity));
  }
  if (!factory) {
    return api::Result<IResourcePool*>(
        api::Status::FromModule(api::StatusCode::kInvalidArgument, "resource factory is empty",
                                api::ErrorModule::kPool, api::kPoolNullFactory));
  }
  return api::Result<IResourcePool*>(new ResourcePool(factory, options));
}

api::Result<IResourcePool*> NewResourcePool(const ResourceFactory& factory, std::size_t capacity) {
  PoolOptions options;
  options.capacity = capacity;
  return CreateResourcePool(factory, options);
}

}  // namespace pool
}  // namespace poolkit
