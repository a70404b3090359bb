#pragma once

#include <cstddef>
#include <cstdint>

#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"

namespace poolkit {
namespace concurrent {

template <typename T>
class IQueue {
 public:
  virtual ~IQueue() {}

  // 返回实现名称，便于故障定位与性能归因。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放实例对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 非阻塞入队。
  // 返回：
  // - kOk：入队成功。
  // - kWouldBlock：队列当前不可写（已满）。
  // - kInternalError：内存分配失败。
  // 线程安全：线程安全。
  virtual api::Status TryPush(const T& value) = 0;

  // 非阻塞移动入队，避免不必要的拷贝。
  // 返回语义与 TryPush(const T&) 一致。
  virtual api::Status TryPushMove(T&& value) = 0;

  // 非阻塞出队，按 FIFO 顺序返回元素。
  // 返回：
  // - kOk：value 为出队元素。
  // - kWouldBlock：队列当前无可读数据。
  // 线程安全：线程安全。
  virtual api::Result<T> TryPop() = 0;

  // 返回队列近似长度。
  // 说明：并发场景下仅用于监控，不保证瞬时强一致，但不会超过 Capacity()。
  virtual std::size_t ApproxSize() const = 0;

  // 返回当前是否为空（近似语义）。
  virtual bool IsEmpty() const = 0;

  // 清空队列中的当前元素。被丢弃的元素直接析构。
  virtual api::Status Clear() = 0;

  // 返回容量上限。0 表示无固定上限。
  virtual std::size_t Capacity() const = 0;
};

}  // namespace concurrent
}  // namespace poolkit
