#pragma once

#include <cstddef>
#include <cstdint>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"
#include "poolkit/pool/i_resource.hpp"
#include "poolkit/pool/pool_options.hpp"

namespace poolkit {
namespace pool {

// 有界资源池：缓存昂贵的可关闭资源，在多个工作线程之间复用。
// 容量只限制“空闲”资源数量，不限制同时借出的资源数量。
class IResourcePool {
 public:
  virtual ~IResourcePool() {}

  // 返回实现名称。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放资源池对象本身：先执行 Close()，再销毁对象。调用后指针失效。
  virtual void Release() = 0;

  // 借出一个资源，不会阻塞等待。
  // 返回：
  // - kOk：value 为空闲队列中的资源，或由工厂新建的资源。
  // - kClosed：资源池已关闭且空闲资源已清空。
  // - 工厂返回的错误：原样透传（错误码、hex 码、消息均不变）。
  // - kInternalError：工厂返回空资源或抛出异常。
  // 说明：本操作不获取资源池锁。Close 进行中或刚完成时，仍可能由工厂新建资源并借出；
  //       调用方照常归还即可，ReleaseResource 会在锁内检查状态并将其关闭。
  // 线程安全：线程安全。
  virtual api::Result<ResourcePtr> Acquire() = 0;

  // 归还一个资源。
  // - 资源池已关闭：立即关闭该资源。
  // - 空闲队列未满：放回队列供后续复用。
  // - 空闲队列已满：立即关闭该资源（正常的丢弃路径，不是错误）。
  // 关闭失败只记录日志，不向调用方传播。空指针会被忽略。
  // 线程安全：线程安全，与 Close 互斥。
  virtual void ReleaseResource(const ResourcePtr& resource) = 0;

  // 关闭资源池：切换为 Closed 状态，并逐个关闭空闲队列中的资源（每个恰好一次）。
  // 幂等：重复调用不产生任何效果。不会等待或影响已借出的资源。
  // 线程安全：线程安全，与 ReleaseResource 互斥。
  virtual void Close() = 0;

  // 当前生命周期状态。Closed 为终态。
  virtual PoolState State() const = 0;

  virtual bool IsClosed() const = 0;

  // 空闲资源数量上限。
  virtual std::size_t Capacity() const = 0;

  // 当前空闲资源数量（近似值，不会超过 Capacity()）。
  virtual std::size_t IdleCount() const = 0;

  // 获取运行时统计信息快照。
  virtual api::Result<PoolStats> QueryStats() const = 0;
};

// 创建资源池。
// 返回：
// - kOk：value 为新建的资源池，调用方负责调用 Release()。
// - kInvalidArgument：capacity 为 0（POOL_INVALID_CAPACITY）或 factory 为空（POOL_NULL_FACTORY）。
POOLKIT_API api::Result<IResourcePool*> CreateResourcePool(const ResourceFactory& factory,
                                                           const PoolOptions& options);

// 以默认选项创建容量为 capacity 的资源池。
POOLKIT_API api::Result<IResourcePool*> NewResourcePool(const ResourceFactory& factory,
                                                        std::size_t capacity);

}  // namespace pool
}  // namespace poolkit
