#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <new>
#include <utility>

#include "poolkit/api/version.hpp"
#include "poolkit/concurrent/i_queue.hpp"

namespace poolkit {
namespace concurrent {

#define PK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kConcurrent, (detail))

// Bounded FIFO guarded by a single mutex. capacity == 0 means unbounded.
template <typename T>
class BasicMutexQueueImpl : public IQueue<T> {
 public:
  explicit BasicMutexQueueImpl(std::size_t capacity = 0) : capacity_(capacity) {}
  virtual ~BasicMutexQueueImpl() {}

  virtual const char* Name() const { return "poolkit.concurrent.basic_mutex_queue"; }
  virtual std::uint32_t ApiVersion() const { return api::kApiVersion; }
  virtual void Release() { delete this; }

  virtual api::Status TryPush(const T& value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (capacity_ > 0 && queue_.size() >= capacity_) {
      return PK_STATUS(api::StatusCode::kWouldBlock, "queue is full", api::kQueueFull);
    }
    try {
      queue_.push_back(value);
    } catch (const std::bad_alloc&) {
      return PK_STATUS(api::StatusCode::kInternalError, "queue allocation failed", 0);
    }
    return api::Status::Ok();
  }

  virtual api::Status TryPushMove(T&& value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (capacity_ > 0 && queue_.size() >= capacity_) {
      return PK_STATUS(api::StatusCode::kWouldBlock, "queue is full", api::kQueueFull);
    }
    try {
      queue_.push_back(std::move(value));
    } catch (const std::bad_alloc&) {
      return PK_STATUS(api::StatusCode::kInternalError, "queue allocation failed", 0);
    }
    return api::Status::Ok();
  }

  virtual api::Result<T> TryPop() {
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.empty()) {
      return api::Result<T>(
          PK_STATUS(api::StatusCode::kWouldBlock, "queue is empty", api::kQueueEmpty));
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return api::Result<T>(value);
  }

  virtual std::size_t ApproxSize() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  virtual bool IsEmpty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.empty();
  }

  virtual api::Status Clear() {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.clear();
    return api::Status::Ok();
  }

  virtual std::size_t Capacity() const { return capacity_; }

 private:
  std::size_t capacity_;
  mutable std::mutex mu_;
  std::deque<T> queue_;
};

template <typename T>
using BasicMutexQueue = BasicMutexQueueImpl<T>;

#undef PK_STATUS

}  // namespace concurrent
}  // namespace poolkit
