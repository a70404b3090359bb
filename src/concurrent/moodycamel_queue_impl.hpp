#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <concurrentqueue.h>

#include "poolkit/api/version.hpp"
#include "poolkit/concurrent/i_queue.hpp"

namespace poolkit {
namespace concurrent {

#define PK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kConcurrent, (detail))

// Lock-free queue on top of moodycamel::ConcurrentQueue.
// The underlying queue is unbounded; when capacity > 0 the bound is enforced
// by reserving a slot in size_ before enqueueing, so ApproxSize() never
// exceeds capacity. Ordering is FIFO per producer thread.
// At most kMaxInitialSize slots are preallocated; further blocks are
// allocated on demand, so a large capacity costs nothing up front.
template <typename T>
class MoodycamelQueueImpl : public IQueue<T> {
 public:
  static const std::size_t kMaxInitialSize =
      32 * moodycamel::ConcurrentQueueDefaultTraits::BLOCK_SIZE;

  explicit MoodycamelQueueImpl(std::size_t capacity = 0)
      : queue_(capacity == 0 ? kMaxInitialSize : std::min(capacity, kMaxInitialSize)),
        capacity_(capacity),
        size_(0) {}

  virtual ~MoodycamelQueueImpl() {}

  virtual const char* Name() const { return "poolkit.concurrent.moodycamel_queue"; }
  virtual std::uint32_t ApiVersion() const { return api::kApiVersion; }
  virtual void Release() { delete this; }

  virtual api::Status TryPush(const T& value) {
    if (!ReserveSlot()) {
      return PK_STATUS(api::StatusCode::kWouldBlock, "queue is full", api::kQueueFull);
    }
    try {
      if (!queue_.enqueue(value)) {
        size_.fetch_sub(1, std::memory_order_acq_rel);
        return PK_STATUS(api::StatusCode::kInternalError, "queue allocation failed", 0);
      }
    } catch (const std::bad_alloc&) {
      size_.fetch_sub(1, std::memory_order_acq_rel);
      return PK_STATUS(api::StatusCode::kInternalError, "queue allocation failed", 0);
    }
    return api::Status::Ok();
  }

  virtual api::Status TryPushMove(T&& value) {
    if (!ReserveSlot()) {
      return PK_STATUS(api::StatusCode::kWouldBlock, "queue is full", api::kQueueFull);
    }
    try {
      if (!queue_.enqueue(std::move(value))) {
        size_.fetch_sub(1, std::memory_order_acq_rel);
        return PK_STATUS(api::StatusCode::kInternalError, "queue allocation failed", 0);
      }
    } catch (const std::bad_alloc&) {
      size_.fetch_sub(1, std::memory_order_acq_rel);
      return PK_STATUS(api::StatusCode::kInternalError, "queue allocation failed", 0);
    }
    return api::Status::Ok();
  }

  virtual api::Result<T> TryPop() {
    T value;
    if (!queue_.try_dequeue(value)) {
      return api::Result<T>(
          PK_STATUS(api::StatusCode::kWouldBlock, "queue is empty", api::kQueueEmpty));
    }
    size_.fetch_sub(1, std::memory_order_acq_rel);
    return api::Result<T>(value);
  }

  virtual std::size_t ApproxSize() const {
    const std::int64_t n = size_.load(std::memory_order_acquire);
    return n < 0 ? 0 : static_cast<std::size_t>(n);
  }

  virtual bool IsEmpty() const { return ApproxSize() == 0; }

  virtual api::Status Clear() {
    T value;
    while (queue_.try_dequeue(value)) {
      size_.fetch_sub(1, std::memory_order_acq_rel);
    }
    return api::Status::Ok();
  }

  virtual std::size_t Capacity() const { return capacity_; }

 private:
  bool ReserveSlot() {
    std::int64_t current = size_.load(std::memory_order_acquire);
    do {
      if (capacity_ > 0 && current >= static_cast<std::int64_t>(capacity_)) return false;
    } while (!size_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                          std::memory_order_acquire));
    return true;
  }

  moodycamel::ConcurrentQueue<T> queue_;
  std::size_t capacity_;
  std::atomic<std::int64_t> size_;
};

template <typename T>
using MoodycamelQueue = MoodycamelQueueImpl<T>;

template <typename T>
const std::size_t MoodycamelQueueImpl<T>::kMaxInitialSize;

#undef PK_STATUS

}  // namespace concurrent
}  // namespace poolkit
