#pragma once

#include <memory>
#include <utility>

#include "poolkit/api/status.hpp"
#include "poolkit/pool/i_resource_pool.hpp"

namespace poolkit {
namespace pool {

// Holds one acquired resource and hands it back to its pool on destruction.
//
//   ResourceLease lease;
//   api::Status st = AcquireLease(pool, &lease);
//   if (!st.ok()) return st;
//   lease.As<Connection>()->Exec("select 1");
//
// The pool must outlive every lease taken from it.
class ResourceLease {
 public:
  ResourceLease() : pool_(NULL) {}
  ResourceLease(IResourcePool* pool, const ResourcePtr& resource)
      : pool_(pool), resource_(resource) {}

  ResourceLease(ResourceLease&& other) : pool_(other.pool_), resource_(std::move(other.resource_)) {
    other.pool_ = NULL;
    other.resource_.reset();
  }

  ResourceLease& operator=(ResourceLease&& other) {
    if (this != &other) {
      Reset();
      pool_ = other.pool_;
      resource_ = std::move(other.resource_);
      other.pool_ = NULL;
      other.resource_.reset();
    }
    return *this;
  }

  ResourceLease(const ResourceLease&) = delete;
  ResourceLease& operator=(const ResourceLease&) = delete;

  ~ResourceLease() { Reset(); }

  // Return the resource to the pool now.
  void Reset() {
    if (pool_ != NULL && resource_) {
      pool_->ReleaseResource(resource_);
    }
    resource_.reset();
    pool_ = NULL;
  }

  // Give up the lease without returning the resource; the caller becomes
  // responsible for releasing or closing it.
  ResourcePtr Detach() {
    ResourcePtr out = std::move(resource_);
    resource_.reset();
    pool_ = NULL;
    return out;
  }

  template <typename T>
  std::shared_ptr<T> As() const {
    return std::dynamic_pointer_cast<T>(resource_);
  }

  const ResourcePtr& resource() const { return resource_; }
  IResource* get() const { return resource_.get(); }
  IResource* operator->() const { return resource_.get(); }
  explicit operator bool() const { return static_cast<bool>(resource_); }

 private:
  IResourcePool* pool_;
  ResourcePtr resource_;
};

// Acquire a resource from pool into *out. On failure *out is left empty.
inline api::Status AcquireLease(IResourcePool* pool, ResourceLease* out) {
  if (pool == NULL || out == NULL) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "pool or out is null",
                                   api::ErrorModule::kPool);
  }
  out->Reset();
  api::Result<ResourcePtr> acquired = pool->Acquire();
  if (!acquired.ok()) {
    return acquired.status();
  }
  *out = ResourceLease(pool, acquired.value());
  return api::Status::Ok();
}

}  // namespace pool
}  // namespace poolkit
